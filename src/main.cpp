#include <iostream>
#include <unistd.h>

#include "app/Cli.hpp"

int main(int argc, char *argv[])
{
    // Приглашение только для интерактивного ввода
    return runQuestions(argc, argv, std::cin, std::cout, std::cerr, isatty(STDIN_FILENO) != 0);
}
