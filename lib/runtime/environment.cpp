// xmas/runtime/environment.cpp - Interpreter state and scope guards
//
#include "xmas/runtime/environment.hpp"

#include "xmas/basic/utf8.hpp"

namespace xmas
{

Value make_input_grid(std::string_view text)
{
  Value::Grid rows;
  while (!text.empty()) {
    const size_t nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    Value::Array row;
    row.reserve(line.size());
    for (const auto ch : utf8_chars(line)) {
      row.push_back(Value::make_string(std::string(ch)));
    }
    rows.push_back(std::move(row));
  }
  return Value::make_grid(std::move(rows));
}

// ============================================================================
// Environment
// ============================================================================

const Value * Environment::lookup(std::string_view name) const
{
  auto it = variables_.find(name);
  return it != variables_.end() ? &it->second : nullptr;
}

void Environment::assign(std::string_view name, Value value)
{
  auto it = variables_.find(name);
  if (it != variables_.end()) {
    it->second = std::move(value);
    return;
  }
  variables_.emplace(std::string(name), std::move(value));
}

void Environment::erase(std::string_view name)
{
  auto it = variables_.find(name);
  if (it != variables_.end()) {
    variables_.erase(it);
  }
}

void Environment::define_function(const FunctionDefStmt * def)
{
  auto it = functions_.find(def->name);
  if (it != functions_.end()) {
    it->second = def;
    return;
  }
  functions_.emplace(std::string(def->name), def);
}

const FunctionDefStmt * Environment::find_function(std::string_view name) const
{
  auto it = functions_.find(name);
  return it != functions_.end() ? it->second : nullptr;
}

const Value * Environment::named_return(std::string_view name) const
{
  auto it = named_returns_.find(name);
  return it != named_returns_.end() ? &it->second : nullptr;
}

void Environment::set_named_return(std::string_view name, Value value)
{
  auto it = named_returns_.find(name);
  if (it != named_returns_.end()) {
    it->second = std::move(value);
    return;
  }
  named_returns_.emplace(std::string(name), std::move(value));
}

// ============================================================================
// ReturnScope
// ============================================================================

ReturnScope::ReturnScope(Environment & env)
: env_(env),
  saved_return_(std::move(env.return_value_)),
  saved_named_(std::move(env.named_returns_))
{
  env_.return_value_.reset();
  env_.named_returns_.clear();
}

ReturnScope::~ReturnScope()
{
  env_.return_value_ = std::move(saved_return_);
  env_.named_returns_ = std::move(saved_named_);
}

// ============================================================================
// BindingScope
// ============================================================================

void BindingScope::bind(std::string_view name, Value value)
{
  Saved saved{std::string(name), std::nullopt};
  if (const Value * prev = env_.lookup(name)) {
    saved.previous = *prev;
  }
  saved_.push_back(std::move(saved));
  env_.assign(name, std::move(value));
}

BindingScope::~BindingScope()
{
  for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
    if (it->previous) {
      env_.assign(it->name, std::move(*it->previous));
    } else {
      env_.erase(it->name);
    }
  }
}

}  // namespace xmas
