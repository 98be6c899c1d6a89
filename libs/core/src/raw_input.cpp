/**
 * @file raw_input.cpp
 * @brief Raw field map and key/value text parsing.
 * @author Watosn
 */

#include "conveyorcalc/core/raw_input.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace conveyorcalc::core {
namespace {

bool parse_double(std::string_view text, double& value) {
  if (text.empty()) {
    return false;
  }
  const std::string s(text);
  std::size_t consumed = 0;
  try {
    value = std::stod(s, &consumed);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
  return consumed == s.size();
}

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

}  // namespace

std::string_view trim(std::string_view text) {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

std::string format_value(const FieldValue& value) {
  if (const auto* b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  if (const auto* s = std::get_if<std::string>(&value)) {
    return *s;
  }
  std::array<char, 64> buf{};
  const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), std::get<double>(value));
  return std::string(buf.data(), res.ptr);
}

bool RawInput::contains(std::string_view key) const { return find(key) != nullptr; }

const FieldValue* RawInput::find(std::string_view key) const {
  const auto it = fields_.find(std::string(key));
  return (it == fields_.end()) ? nullptr : &it->second;
}

std::optional<double> RawInput::get_number(std::string_view key) const {
  const auto* v = find(key);
  if (v == nullptr) {
    return std::nullopt;
  }
  if (const auto* d = std::get_if<double>(v)) {
    return *d;
  }
  if (const auto* b = std::get_if<bool>(v)) {
    return *b ? 1.0 : 0.0;
  }
  double parsed = 0.0;
  if (parse_double(trim(std::get<std::string>(*v)), parsed)) {
    return parsed;
  }
  return std::nullopt;
}

std::optional<bool> RawInput::get_bool(std::string_view key) const {
  const auto* v = find(key);
  if (v == nullptr) {
    return std::nullopt;
  }
  if (const auto* b = std::get_if<bool>(v)) {
    return *b;
  }
  if (const auto* d = std::get_if<double>(v)) {
    return *d != 0.0;
  }
  const auto& s = std::get<std::string>(*v);
  if (s == "true") {
    return true;
  }
  if (s == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::string> RawInput::get_string(std::string_view key) const {
  const auto* v = find(key);
  if (v == nullptr) {
    return std::nullopt;
  }
  return format_value(*v);
}

void RawInput::erase(std::string_view key) {
  const auto it = fields_.find(std::string(key));
  if (it != fields_.end()) {
    fields_.erase(it);
  }
}

RawInput RawInput::with(std::string key, FieldValue value) const {
  RawInput out = *this;
  out.set(std::move(key), std::move(value));
  return out;
}

RawInput RawInput::without(std::string_view key) const {
  RawInput out = *this;
  out.erase(key);
  return out;
}

FieldValue parse_scalar(std::string_view text) {
  const auto t = trim(text);
  if (t == "true") {
    return true;
  }
  if (t == "false") {
    return false;
  }
  if (t.size() >= 2 && t.front() == '"' && t.back() == '"') {
    return std::string(t.substr(1, t.size() - 2));
  }
  double value = 0.0;
  if (parse_double(t, value)) {
    return value;
  }
  return std::string(t);
}

TextParseResult parse_key_values(std::string_view text) {
  TextParseResult out{};
  std::istringstream in{std::string(text)};
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string_view view = line;
    const auto hash = view.find('#');
    if (hash != std::string_view::npos) {
      view = view.substr(0, hash);
    }
    view = trim(view);
    if (view.empty()) {
      continue;
    }
    const auto eq = view.find('=');
    if (eq == std::string_view::npos) {
      out.errors.push_back("line " + std::to_string(line_no) + ": expected key = value");
      continue;
    }
    const auto key = trim(view.substr(0, eq));
    if (key.empty()) {
      out.errors.push_back("line " + std::to_string(line_no) + ": empty key");
      continue;
    }
    out.input.set(std::string(key), parse_scalar(view.substr(eq + 1)));
  }
  if (!out.errors.empty()) {
    out.status = Status::ParseError;
  }
  return out;
}

TextParseResult load_key_value_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    TextParseResult out{};
    out.errors.push_back("cannot open " + path.string());
    out.status = Status::DataUnavailable;
    return out;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_key_values(ss.str());
}

}  // namespace conveyorcalc::core
