#pragma once
#include <stdexcept>
#include <string>

namespace XmlJsonBridge {

// Base of every failure raised by a conversion. Nothing that throws one of
// these leaves a partially built tree behind.
class ConversionError : public std::runtime_error {
public:
  explicit ConversionError(const std::string &msg) : std::runtime_error(msg) {}
};

// Malformed XML or JSON text.
class ParseError : public ConversionError {
public:
  explicit ParseError(const std::string &msg) : ConversionError(msg) {}
};

// Input or configuration with an invalid shape, detected before any tree is
// built.
class ValidationError : public ConversionError {
public:
  explicit ValidationError(const std::string &msg) : ConversionError(msg) {}
};

// Failure inside the conversion logic itself (including transformers that
// have no recovery hook).
class ProcessingError : public ConversionError {
public:
  explicit ProcessingError(const std::string &msg) : ConversionError(msg) {}
};

} // namespace XmlJsonBridge
