#pragma once

#include <stdexcept>
#include <string>

namespace flowart {

// Base of every error a render can raise.
//
// All of these are detected while validating a Configuration, before any pixel
// is drawn. field() names the offending Configuration field (or JSON key) and
// value() is a printable rendition of what was supplied, so a batch
// orchestrator can log the item and move on.
class RenderError : public std::runtime_error {
 public:
  RenderError(std::string field, std::string value, const std::string& message)
      : std::runtime_error(message), field_(std::move(field)), value_(std::move(value)) {}

  const std::string& field() const { return field_; }
  const std::string& value() const { return value_; }

 private:
  std::string field_;
  std::string value_;
};

// Values that cannot describe a usable render (non-positive sizes, empty grid,
// bad densities, malformed or missing fields, unknown enum names).
class ConfigurationError : public RenderError {
 public:
  using RenderError::RenderError;
};

// Zero-length color LUT with no fallback color.
class ColorLookupError : public RenderError {
 public:
  using RenderError::RenderError;
};

// Margin leaves no drawable area.
class BoundsError : public RenderError {
 public:
  using RenderError::RenderError;
};

} // namespace flowart
