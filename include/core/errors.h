#pragma once

#include <stdexcept>
#include <string>

namespace core {

// Нельзя построить фон / неверная конфигурация. Фатально, до обработки кадров.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Источник кадров не открывается или чтение сломалось посреди клипа.
class SourceReadError : public std::runtime_error {
public:
    explicit SourceReadError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace core
