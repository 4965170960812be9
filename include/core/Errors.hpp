#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Неверные аргументы командной строки
class UsageError : public std::invalid_argument
{
public:
    explicit UsageError(const std::string &message) : std::invalid_argument(message) {}
};

// Каталог корпуса не существует
class NotFoundError : public std::runtime_error
{
public:
    explicit NotFoundError(const std::string &message) : std::runtime_error(message) {}
};

// Вырожденные числовые входы: ноль документов, пустое предложение.
// Это нарушение контракта вызывающей стороны, а не штатная ситуация.
class DomainError : public std::domain_error
{
public:
    explicit DomainError(const std::string &message) : std::domain_error(message) {}
};

#endif
