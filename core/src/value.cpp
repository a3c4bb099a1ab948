#include "arbiter/value.h"

#include <cmath>
#include <sstream>

namespace arbiter {

namespace {

std::string format_real(double value) {
  if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
    std::ostringstream out;
    out << static_cast<int64_t>(value) << ".0";
    return out.str();
  }
  std::ostringstream out;
  out.precision(15);
  out << value;
  return out.str();
}

std::string quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

}  // namespace

std::optional<double> Value::as_number() const {
  if (kind == Kind::Integer) return static_cast<double>(int_value);
  if (kind == Kind::Real) return real_value;
  return std::nullopt;
}

std::string Value::to_text() const {
  switch (kind) {
    case Kind::Null:
      return "None";
    case Kind::Bool:
      return bool_value ? "True" : "False";
    case Kind::Integer:
      return std::to_string(int_value);
    case Kind::Real:
      return format_real(real_value);
    case Kind::String:
      return string_value;
    case Kind::List:
    case Kind::Range:
      return to_display();
  }
  return "";
}

std::string Value::to_display() const {
  switch (kind) {
    case Kind::String:
      return quote(string_value);
    case Kind::List: {
      std::string out = "[";
      for (size_t i = 0; i < list_value.size(); ++i) {
        if (i != 0) out += ", ";
        out += list_value[i].to_display();
      }
      out += "]";
      return out;
    }
    case Kind::Range:
      return "range(" + std::to_string(range_lo) + ", " + std::to_string(range_hi) + ")";
    default:
      return to_text();
  }
}

Value make_null() { return Value{}; }

Value make_bool(bool value) {
  Value out;
  out.kind = Value::Kind::Bool;
  out.bool_value = value;
  return out;
}

Value make_integer(int64_t value) {
  Value out;
  out.kind = Value::Kind::Integer;
  out.int_value = value;
  return out;
}

Value make_real(double value) {
  Value out;
  out.kind = Value::Kind::Real;
  out.real_value = value;
  return out;
}

Value make_string(std::string value) {
  Value out;
  out.kind = Value::Kind::String;
  out.string_value = std::move(value);
  return out;
}

Value make_list(std::vector<Value> values) {
  Value out;
  out.kind = Value::Kind::List;
  out.list_value = std::move(values);
  return out;
}

Value make_range(int64_t lo, int64_t hi) {
  Value out;
  out.kind = Value::Kind::Range;
  out.range_lo = lo;
  out.range_hi = hi;
  return out;
}

bool values_equal(const Value& left, const Value& right) {
  if (left.is_number() && right.is_number()) {
    if (left.kind == Value::Kind::Integer && right.kind == Value::Kind::Integer) {
      return left.int_value == right.int_value;
    }
    return *left.as_number() == *right.as_number();
  }
  if (left.kind != right.kind) return false;
  switch (left.kind) {
    case Value::Kind::Null:
      return true;
    case Value::Kind::Bool:
      return left.bool_value == right.bool_value;
    case Value::Kind::String:
      return left.string_value == right.string_value;
    case Value::Kind::List:
      if (left.list_value.size() != right.list_value.size()) return false;
      for (size_t i = 0; i < left.list_value.size(); ++i) {
        if (!values_equal(left.list_value[i], right.list_value[i])) return false;
      }
      return true;
    case Value::Kind::Range:
      return left.range_lo == right.range_lo && left.range_hi == right.range_hi;
    default:
      return false;
  }
}

std::optional<int> compare_values(const Value& left, const Value& right) {
  if (left.is_number() && right.is_number()) {
    if (left.kind == Value::Kind::Integer && right.kind == Value::Kind::Integer) {
      if (left.int_value < right.int_value) return -1;
      return left.int_value > right.int_value ? 1 : 0;
    }
    double l = *left.as_number();
    double r = *right.as_number();
    if (std::isnan(l) || std::isnan(r)) return std::nullopt;
    if (l < r) return -1;
    return l > r ? 1 : 0;
  }
  if (left.kind == Value::Kind::String && right.kind == Value::Kind::String) {
    int cmp = left.string_value.compare(right.string_value);
    if (cmp < 0) return -1;
    return cmp > 0 ? 1 : 0;
  }
  return std::nullopt;
}

std::string kind_name(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::Null:
      return "null";
    case Value::Kind::Bool:
      return "bool";
    case Value::Kind::Integer:
      return "integer";
    case Value::Kind::Real:
      return "real";
    case Value::Kind::String:
      return "string";
    case Value::Kind::List:
      return "list";
    case Value::Kind::Range:
      return "range";
  }
  return "unknown";
}

}  // namespace arbiter
