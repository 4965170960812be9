#ifndef CLI_HPP
#define CLI_HPP

#include <iosfwd>

// Полный запуск: разбор аргументов, загрузка корпуса, один запрос из in,
// предложения по одному на строку в out. Возвращает код завершения:
// 0 - успех, 1 - ошибка выполнения, 2 - неверные аргументы.
int runQuestions(int argc, const char *const argv[],
                 std::istream &in, std::ostream &out, std::ostream &err,
                 bool prompt);

#endif
