// record.cpp - RecordKind and property reconstruction

#include <optics_ext/record.h>

#include <algorithm>
#include <stdexcept>

namespace optics_ext {

RecordKind::RecordKind(std::string name, std::vector<std::string> field_names, Invariant invariant)
    : name_(std::move(name))
    , field_names_(std::move(field_names))
    , invariant_(std::move(invariant))
{}

RecordKindPtr RecordKind::make(std::string name, std::vector<std::string> field_names, Invariant invariant)
{
    for (std::size_t i = 0; i < field_names.size(); ++i) {
        auto dup = std::find(field_names.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                             field_names.end(), field_names[i]);
        if (dup != field_names.end()) {
            throw std::invalid_argument("RecordKind '" + name + "': duplicate field '" + field_names[i] + "'");
        }
    }
    return RecordKindPtr{new RecordKind(std::move(name), std::move(field_names), std::move(invariant))};
}

std::optional<std::size_t> RecordKind::field_index(std::string_view field) const noexcept
{
    for (std::size_t i = 0; i < field_names_.size(); ++i) {
        if (field_names_[i] == field) return i;
    }
    return std::nullopt;
}

void RecordKind::validate(const ValueVector& fields) const
{
    if (fields.size() != arity()) {
        detail::log_access_error("RecordKind::validate", "field count does not match kind arity");
        throw std::invalid_argument("RecordKind '" + name_ + "': expected " + std::to_string(arity()) +
                                    " fields, got " + std::to_string(fields.size()));
    }
    if (invariant_) {
        invariant_(*this, fields);
    }
}

Value RecordKind::construct(ValueVector fields) const
{
    validate(fields);
    return Value{ValueRecord{shared_from_this(), std::move(fields)}};
}

Value RecordKind::make_record(std::initializer_list<Value> fields) const
{
    auto t = ValueVector{}.transient();
    for (const auto& f : fields) {
        t.push_back(ValueBox{f});
    }
    return construct(t.persistent());
}

// ============================================================
// Reconstruction helper
// ============================================================

std::vector<std::string> property_names(const Value& obj)
{
    if (auto* r = obj.get_if<ValueRecord>()) {
        return r->kind->field_names();
    }
    std::vector<std::string> names;
    if (auto* m = obj.get_if<ValueMap>()) {
        names.reserve(m->size());
        for (const auto& [key, box] : *m) {
            names.push_back(key);
        }
    }
    return names;
}

Value set_properties(const Value& obj, const PropertyPatch& patch)
{
    if (auto* r = obj.get_if<ValueRecord>()) {
        auto t = r->fields.transient();
        for (const auto& [name, val] : patch) {
            auto idx = r->kind->field_index(name);
            if (!idx) {
                detail::throw_missing_field("set_properties", r->kind->name(), name);
            }
            t.set(*idx, ValueBox{val});
        }
        return r->kind->construct(t.persistent());
    }
    if (auto* m = obj.get_if<ValueMap>()) {
        auto t = m->transient();
        for (const auto& [name, val] : patch) {
            if (!m->count(name)) {
                detail::throw_missing_field("set_properties", "map", name);
            }
            t.set(name, ValueBox{val});
        }
        return Value{t.persistent()};
    }
    if (!patch.empty()) {
        detail::throw_missing_field("set_properties", value_type_name(obj), patch.front().first);
    }
    return obj;
}

} // namespace optics_ext
