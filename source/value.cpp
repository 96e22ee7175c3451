// value.cpp - Value accessors, equality and printing

#include <optics_ext/value.h>
#include <optics_ext/record.h>

#include <ostream>
#include <sstream>

namespace optics_ext {

// ============================================================
// Lenient accessors
// ============================================================

Value Value::at(const std::string& key) const
{
    if (auto* m = get_if<ValueMap>()) {
        if (auto* found = m->find(key)) return found->get();
    }
    if (auto* r = get_if<ValueRecord>()) {
        if (auto idx = r->kind->field_index(key)) return r->fields[*idx].get();
    }
    detail::log_key_error("Value::at", key, "not found or type mismatch");
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) return (*v)[index].get();
    }
    detail::log_index_error("Value::at", index, "out of range or type mismatch");
    return Value{};
}

int64_t Value::as_int64(int64_t default_val) const
{
    if (auto* p = get_if<int32_t>()) return *p;
    if (auto* p = get_if<int64_t>()) return *p;
    return default_val;
}

double Value::as_number(double default_val) const
{
    if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
    if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
    if (auto* p = get_if<double>()) return *p;
    return default_val;
}

std::size_t Value::count(const std::string& key) const
{
    if (auto* m = get_if<ValueMap>()) return m->count(key);
    if (auto* r = get_if<ValueRecord>()) return r->kind->has_field(key) ? 1 : 0;
    return 0;
}

std::size_t Value::size() const
{
    if (auto* m = get_if<ValueMap>()) return m->size();
    if (auto* v = get_if<ValueVector>()) return v->size();
    if (auto* r = get_if<ValueRecord>()) return r->fields.size();
    return 0;
}

Value Value::set(const std::string& key, Value val) const
{
    if (auto* m = get_if<ValueMap>()) {
        return Value{m->set(key, ValueBox{std::move(val)})};
    }
    if (auto* r = get_if<ValueRecord>()) {
        if (auto idx = r->kind->field_index(key)) {
            return r->kind->construct(r->fields.set(*idx, ValueBox{std::move(val)}));
        }
    }
    detail::log_key_error("Value::set", key, "not a map or unknown record field");
    return *this;
}

Value Value::set(std::size_t index, Value val) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) {
            return Value{v->set(index, ValueBox{std::move(val)})};
        }
    }
    detail::log_index_error("Value::set", index, "out of range or type mismatch");
    return *this;
}

Value Value::push_back(Value val) const
{
    if (auto* v = get_if<ValueVector>()) {
        return Value{v->push_back(ValueBox{std::move(val)})};
    }
    detail::log_access_error("Value::push_back", "value is not a vector");
    return *this;
}

// ============================================================
// Equality and printing
// ============================================================

bool same_record_kind(const RecordKindPtr& a, const RecordKindPtr& b)
{
    if (a == b) return true;
    if (!a || !b) return false;
    return a->name() == b->name() && a->field_names() == b->field_names();
}

std::string value_type_name(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return "int32";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "int64";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "map";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "vector";
        } else {
            return arg.kind ? arg.kind->name() : std::string{"record"};
        }
    }, val.data);
}

namespace {

void print_value(std::ostream& os, const Value& val)
{
    std::visit([&os](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            os << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            os << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int32_t>) {
            os << arg;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            os << arg << "L";
        } else if constexpr (std::is_same_v<T, double>) {
            os << arg;
        } else if constexpr (std::is_same_v<T, std::string>) {
            os << '"' << arg << '"';
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            os << '{';
            bool first = true;
            for (const auto& [key, box] : arg) {
                if (!first) os << ", ";
                first = false;
                os << key << ": ";
                print_value(os, box.get());
            }
            os << '}';
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            os << '[';
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) os << ", ";
                print_value(os, arg[i].get());
            }
            os << ']';
        } else {
            os << (arg.kind ? arg.kind->name() : std::string{"record"}) << '(';
            for (std::size_t i = 0; i < arg.fields.size(); ++i) {
                if (i > 0) os << ", ";
                if (arg.kind && i < arg.kind->arity()) os << arg.kind->field_names()[i] << '=';
                print_value(os, arg.fields[i].get());
            }
            os << ')';
        }
    }, val.data);
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    std::ostringstream oss;
    print_value(oss, val);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    print_value(os, val);
    return os;
}

} // namespace optics_ext
