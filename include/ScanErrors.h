#pragma once
// ScanErrors.h — таксономия ошибок сканера
//
// IOError       — файл/каталог не читается (пишем в статистику, идём дальше)
// TimeoutError  — операция не уложилась в лимит (обрабатывается как IOError)
// PathNotFound  — неверный корень custom-скана (единственная ошибка,
//                 которая доходит до вызывающего кода)
// DetectorError — внутренний сбой одного детектора (превращается в "нет находок")
//
// Отмена пользователем — НЕ ошибка, это ScanStatus::CANCELLED в результате.

#include <stdexcept>
#include <string>

class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IOError : public ScanError {
public:
    using ScanError::ScanError;
};

class TimeoutError : public IOError {
public:
    using IOError::IOError;
};

class PathNotFound : public ScanError {
public:
    explicit PathNotFound(const std::string& path)
        : ScanError("Path not found: " + path), m_path(path) {}
    const std::string& path() const { return m_path; }
private:
    std::string m_path;
};

class DetectorError : public ScanError {
public:
    using ScanError::ScanError;
};
