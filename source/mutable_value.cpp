// mutable_value.cpp - MutableValue implementation

#include <optics_ext/mutable_value.h>
#include <optics_ext/convert.h>
#include <optics_ext/record.h>

#include <ostream>
#include <sstream>
#include <stdexcept>

namespace optics_ext {

namespace {

MutableValue::DataVariant clone_data(const MutableValue::DataVariant& data)
{
    return std::visit([](const auto& arg) -> MutableValue::DataVariant {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, MutableValueMapPtr>) {
            return arg ? std::make_unique<MutableValueMap>(*arg) : MutableValueMapPtr{};
        } else if constexpr (std::is_same_v<T, MutableValueVectorPtr>) {
            return arg ? std::make_unique<MutableValueVector>(*arg) : MutableValueVectorPtr{};
        } else if constexpr (std::is_same_v<T, MutableRecordPtr>) {
            return arg ? std::make_unique<MutableRecord>(*arg) : MutableRecordPtr{};
        } else {
            return arg;
        }
    }, data);
}

void check_record_fields(const RecordKind& kind, const std::vector<MutableValue>& fields)
{
    auto t = ValueVector{}.transient();
    for (const auto& field : fields) {
        t.push_back(ValueBox{to_value(field)});
    }
    kind.validate(t.persistent());
}

} // anonymous namespace

// ============================================================
// Construction / copy
// ============================================================

MutableValue::MutableValue(MutableValueMap v) : data(std::make_unique<MutableValueMap>(std::move(v))) {}

MutableValue::MutableValue(MutableValueVector v) : data(std::make_unique<MutableValueVector>(std::move(v))) {}

MutableValue::MutableValue(MutableRecord v) : data(std::make_unique<MutableRecord>(std::move(v))) {}

MutableValue::MutableValue(const MutableValue& other) : data(clone_data(other.data)) {}

MutableValue& MutableValue::operator=(const MutableValue& other)
{
    if (this != &other) {
        data = clone_data(other.data);
    }
    return *this;
}

MutableValue::~MutableValue() = default;

MutableValue MutableValue::map()
{
    return MutableValue{MutableValueMap{}};
}

MutableValue MutableValue::map(std::initializer_list<std::pair<std::string, MutableValue>> init)
{
    MutableValueMap m;
    m.reserve(init.size());
    for (const auto& [key, val] : init) {
        m.insert_or_assign(key, val);
    }
    return MutableValue{std::move(m)};
}

MutableValue MutableValue::vector()
{
    return MutableValue{MutableValueVector{}};
}

MutableValue MutableValue::vector(std::initializer_list<MutableValue> init)
{
    return MutableValue{MutableValueVector(init)};
}

MutableValue MutableValue::record(RecordKindPtr kind, std::vector<MutableValue> fields)
{
    if (!kind) {
        throw std::invalid_argument("MutableValue::record: null record kind");
    }
    check_record_fields(*kind, fields);
    return MutableValue{MutableRecord{std::move(kind), std::move(fields)}};
}

// ============================================================
// Access
// ============================================================

double MutableValue::as_number(double default_val) const
{
    if (auto* p = get_if<double>())
        return *p;
    if (auto* p = get_if<int64_t>())
        return static_cast<double>(*p);
    if (auto* p = get_if<int32_t>())
        return static_cast<double>(*p);
    return default_val;
}

MutableValueMap* MutableValue::as_map_ptr()
{
    auto* p = get_if<MutableValueMapPtr>();
    return p ? p->get() : nullptr;
}

const MutableValueMap* MutableValue::as_map_ptr() const
{
    auto* p = get_if<MutableValueMapPtr>();
    return p ? p->get() : nullptr;
}

MutableValueVector* MutableValue::as_vector_ptr()
{
    auto* p = get_if<MutableValueVectorPtr>();
    return p ? p->get() : nullptr;
}

const MutableValueVector* MutableValue::as_vector_ptr() const
{
    auto* p = get_if<MutableValueVectorPtr>();
    return p ? p->get() : nullptr;
}

MutableRecord* MutableValue::as_record_ptr()
{
    auto* p = get_if<MutableRecordPtr>();
    return p ? p->get() : nullptr;
}

const MutableRecord* MutableValue::as_record_ptr() const
{
    auto* p = get_if<MutableRecordPtr>();
    return p ? p->get() : nullptr;
}

MutableValue* MutableValue::get(std::string_view key)
{
    if (auto* m = as_map_ptr()) {
        auto it = m->find(key);
        return it != m->end() ? &it.value() : nullptr;
    }
    if (auto* r = as_record_ptr()) {
        if (auto idx = r->kind->field_index(key)) return &r->fields[*idx];
    }
    return nullptr;
}

const MutableValue* MutableValue::get(std::string_view key) const
{
    if (auto* m = as_map_ptr()) {
        auto it = m->find(key);
        return it != m->end() ? &it->second : nullptr;
    }
    if (auto* r = as_record_ptr()) {
        if (auto idx = r->kind->field_index(key)) return &r->fields[*idx];
    }
    return nullptr;
}

MutableValue& MutableValue::set(std::string_view key, MutableValue val)
{
    if (auto* m = as_map_ptr()) {
        m->insert_or_assign(std::string{key}, std::move(val));
        return *this;
    }
    if (auto* r = as_record_ptr()) {
        if (auto idx = r->kind->field_index(key)) {
            if (r->kind->has_invariant()) {
                auto fields = r->fields;
                fields[*idx] = std::move(val);
                *this = MutableValue::record(r->kind, std::move(fields));
            } else {
                r->fields[*idx] = std::move(val);
            }
            return *this;
        }
    }
    detail::log_key_error("MutableValue::set", key, "not a map or unknown record field");
    return *this;
}

MutableValue* MutableValue::get(std::size_t index)
{
    if (auto* v = as_vector_ptr()) {
        if (index < v->size()) return &(*v)[index];
    }
    return nullptr;
}

const MutableValue* MutableValue::get(std::size_t index) const
{
    if (auto* v = as_vector_ptr()) {
        if (index < v->size()) return &(*v)[index];
    }
    return nullptr;
}

MutableValue& MutableValue::push_back(MutableValue val)
{
    if (auto* v = as_vector_ptr()) {
        v->push_back(std::move(val));
    } else {
        detail::log_access_error("MutableValue::push_back", "value is not a vector");
    }
    return *this;
}

std::size_t MutableValue::size() const
{
    if (auto* m = as_map_ptr()) return m->size();
    if (auto* v = as_vector_ptr()) return v->size();
    if (auto* r = as_record_ptr()) return r->fields.size();
    return 0;
}

// ============================================================
// Equality and printing
// ============================================================

bool operator==(const MutableValue& a, const MutableValue& b)
{
    if (a.data.index() != b.data.index()) return false;
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, MutableValueMapPtr>) {
            if (!lhs || !rhs) return lhs == rhs;
            if (lhs->size() != rhs->size()) return false;
            for (const auto& [key, val] : *lhs) {
                auto it = rhs->find(key);
                if (it == rhs->end() || !(it->second == val)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, MutableValueVectorPtr>) {
            if (!lhs || !rhs) return lhs == rhs;
            return *lhs == *rhs;
        } else if constexpr (std::is_same_v<T, MutableRecordPtr>) {
            if (!lhs || !rhs) return lhs == rhs;
            return same_record_kind(lhs->kind, rhs->kind) && lhs->fields == rhs->fields;
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

namespace {

void print_value(std::ostream& os, const MutableValue& val)
{
    std::visit([&os](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            os << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            os << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, double>) {
            os << arg;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            os << arg << "L";
        } else if constexpr (std::is_same_v<T, std::string>) {
            os << '"' << arg << '"';
        } else if constexpr (std::is_same_v<T, MutableValueMapPtr>) {
            os << '{';
            bool first = true;
            for (const auto& [key, child] : *arg) {
                if (!first) os << ", ";
                first = false;
                os << key << ": ";
                print_value(os, child);
            }
            os << '}';
        } else if constexpr (std::is_same_v<T, MutableValueVectorPtr>) {
            os << '[';
            for (std::size_t i = 0; i < arg->size(); ++i) {
                if (i > 0) os << ", ";
                print_value(os, (*arg)[i]);
            }
            os << ']';
        } else {
            os << arg->kind->name() << '(';
            for (std::size_t i = 0; i < arg->fields.size(); ++i) {
                if (i > 0) os << ", ";
                os << arg->kind->field_names()[i] << '=';
                print_value(os, arg->fields[i]);
            }
            os << ')';
        }
    }, val.data);
}

} // anonymous namespace

std::string value_to_string(const MutableValue& val)
{
    std::ostringstream oss;
    print_value(oss, val);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const MutableValue& val)
{
    print_value(os, val);
    return os;
}

// ============================================================
// Reconstruction helper
// ============================================================

std::vector<std::string> property_names(const MutableValue& obj)
{
    if (auto* r = obj.as_record_ptr()) {
        return r->kind->field_names();
    }
    std::vector<std::string> names;
    if (auto* m = obj.as_map_ptr()) {
        names.reserve(m->size());
        for (const auto& [key, child] : *m) {
            names.push_back(key);
        }
    }
    return names;
}

MutableValue set_properties(MutableValue obj, MutablePropertyPatch patch)
{
    if (auto* r = obj.as_record_ptr()) {
        std::vector<MutableValue> fields = std::move(r->fields);
        for (auto& [name, val] : patch) {
            auto idx = r->kind->field_index(name);
            if (!idx) {
                detail::throw_missing_field("set_properties", r->kind->name(), name);
            }
            fields[*idx] = std::move(val);
        }
        return MutableValue::record(r->kind, std::move(fields));
    }
    if (auto* m = obj.as_map_ptr()) {
        for (auto& [name, val] : patch) {
            auto it = m->find(name);
            if (it == m->end()) {
                detail::throw_missing_field("set_properties", "map", name);
            }
            it.value() = std::move(val);
        }
        return obj;
    }
    if (!patch.empty()) {
        detail::throw_missing_field("set_properties", "value", patch.front().first);
    }
    return obj;
}

} // namespace optics_ext
