// object_traits.cpp - Structural access for Value and MutableValue

#include <optics_ext/object_traits.h>

namespace optics_ext {

namespace detail {

void throw_not_a_collection(std::string_view func, std::string_view type_name)
{
    log_access_error(func, "value is not a collection");
    throw std::invalid_argument(std::string{func} + ": value of type '" + std::string{type_name} +
                                "' has no elements");
}

} // namespace detail

// ============================================================
// object_traits<Value>
// ============================================================

Value object_traits<Value>::get_field(const Value& obj, std::string_view name)
{
    if (auto* r = obj.get_if<ValueRecord>()) {
        if (auto idx = r->kind->field_index(name)) return r->fields[*idx].get();
        detail::throw_missing_field("field_optic", r->kind->name(), name);
    }
    if (auto* m = obj.get_if<ValueMap>()) {
        if (auto* found = m->find(std::string{name})) return found->get();
        detail::throw_missing_field("field_optic", "map", name);
    }
    detail::throw_missing_field("field_optic", value_type_name(obj), name);
}

Value object_traits<Value>::set_field(Value obj, std::string_view name, Value val)
{
    return set_properties(obj, PropertyPatch{{std::string{name}, std::move(val)}});
}

Value object_traits<Value>::get_index(const Value& obj, const std::string& key)
{
    if (auto* m = obj.get_if<ValueMap>()) {
        if (auto* found = m->find(key)) return found->get();
        detail::log_key_error("object_traits<Value>::get_index", key, "not found");
        throw std::out_of_range("key '" + key + "' not found");
    }
    detail::log_key_error("object_traits<Value>::get_index", key, "value is not a map");
    throw std::invalid_argument("cannot index value of type '" + value_type_name(obj) + "' by key '" + key + "'");
}

Value object_traits<Value>::set_index(Value obj, Value val, const std::string& key)
{
    if (auto* m = obj.get_if<ValueMap>()) {
        return Value{m->set(key, ValueBox{std::move(val)})};
    }
    detail::log_key_error("object_traits<Value>::set_index", key, "value is not a map");
    throw std::invalid_argument("cannot index value of type '" + value_type_name(obj) + "' by key '" + key + "'");
}

Value object_traits<Value>::get_position(const Value& obj, std::size_t index)
{
    if (auto* v = obj.get_if<ValueVector>()) {
        if (index < v->size()) return (*v)[index].get();
        detail::log_index_error("object_traits<Value>::get_index", index, "out of range");
        throw std::out_of_range("index " + std::to_string(index) + " out of range for vector of size " +
                                std::to_string(v->size()));
    }
    detail::log_index_error("object_traits<Value>::get_index", index, "value is not a vector");
    throw std::invalid_argument("cannot index value of type '" + value_type_name(obj) + "' by position");
}

Value object_traits<Value>::set_position(Value obj, Value val, std::size_t index)
{
    if (auto* v = obj.get_if<ValueVector>()) {
        if (index < v->size()) return Value{v->set(index, ValueBox{std::move(val)})};
        detail::log_index_error("object_traits<Value>::set_index", index, "out of range");
        throw std::out_of_range("index " + std::to_string(index) + " out of range for vector of size " +
                                std::to_string(v->size()));
    }
    detail::log_index_error("object_traits<Value>::set_index", index, "value is not a vector");
    throw std::invalid_argument("cannot index value of type '" + value_type_name(obj) + "' by position");
}

// ============================================================
// object_traits<MutableValue>
// ============================================================

MutableValue object_traits<MutableValue>::get_field(const MutableValue& obj, std::string_view name)
{
    return field(obj, name);
}

const MutableValue& object_traits<MutableValue>::field(const MutableValue& obj, std::string_view name)
{
    if (auto* r = obj.as_record_ptr()) {
        if (auto idx = r->kind->field_index(name)) return r->fields[*idx];
        detail::throw_missing_field("field_optic", r->kind->name(), name);
    }
    if (auto* m = obj.as_map_ptr()) {
        auto it = m->find(name);
        if (it != m->end()) return it->second;
        detail::throw_missing_field("field_optic", "map", name);
    }
    detail::throw_missing_field("field_optic", obj.is_vector() ? "vector" : "scalar", name);
}

MutableValue object_traits<MutableValue>::set_field(MutableValue obj, std::string_view name, MutableValue val)
{
    MutablePropertyPatch patch;
    patch.emplace_back(std::string{name}, std::move(val));
    return set_properties(std::move(obj), std::move(patch));
}

MutableValue& object_traits<MutableValue>::field_ref(MutableValue& obj, std::string_view name)
{
    if (auto* r = obj.as_record_ptr()) {
        if (auto idx = r->kind->field_index(name)) return r->fields[*idx];
        detail::throw_missing_field("field_optic", r->kind->name(), name);
    }
    if (auto* m = obj.as_map_ptr()) {
        auto it = m->find(name);
        if (it != m->end()) return it.value();
        detail::throw_missing_field("field_optic", "map", name);
    }
    detail::throw_missing_field("field_optic", obj.is_vector() ? "vector" : "scalar", name);
}

MutableValue object_traits<MutableValue>::get_index(const MutableValue& obj, const std::string& key)
{
    if (auto* m = obj.as_map_ptr()) {
        auto it = m->find(key);
        if (it != m->end()) return it->second;
        detail::log_key_error("object_traits<MutableValue>::get_index", key, "not found");
        throw std::out_of_range("key '" + key + "' not found");
    }
    detail::log_key_error("object_traits<MutableValue>::get_index", key, "value is not a map");
    throw std::invalid_argument("cannot index non-map value by key '" + key + "'");
}

MutableValue object_traits<MutableValue>::set_index(MutableValue obj, MutableValue val, const std::string& key)
{
    index_insert_ref(obj, key) = std::move(val);
    return obj;
}

MutableValue& object_traits<MutableValue>::index_ref(MutableValue& obj, const std::string& key)
{
    if (auto* m = obj.as_map_ptr()) {
        auto it = m->find(key);
        if (it != m->end()) return it.value();
        detail::log_key_error("object_traits<MutableValue>::index_ref", key, "not found");
        throw std::out_of_range("key '" + key + "' not found");
    }
    detail::log_key_error("object_traits<MutableValue>::index_ref", key, "value is not a map");
    throw std::invalid_argument("cannot index non-map value by key '" + key + "'");
}

MutableValue& object_traits<MutableValue>::index_insert_ref(MutableValue& obj, const std::string& key)
{
    if (auto* m = obj.as_map_ptr()) {
        return (*m)[key];
    }
    detail::log_key_error("object_traits<MutableValue>::index_insert_ref", key, "value is not a map");
    throw std::invalid_argument("cannot index non-map value by key '" + key + "'");
}

bool object_traits<MutableValue>::writable_in_place(const MutableValue& obj)
{
    auto* r = obj.as_record_ptr();
    return !(r && r->kind->has_invariant());
}

const MutableValue& object_traits<MutableValue>::position(const MutableValue& obj, std::size_t index)
{
    if (auto* v = obj.as_vector_ptr()) {
        if (index < v->size()) return (*v)[index];
        detail::log_index_error("object_traits<MutableValue>::index", index, "out of range");
        throw std::out_of_range("index " + std::to_string(index) + " out of range for vector of size " +
                                std::to_string(v->size()));
    }
    detail::log_index_error("object_traits<MutableValue>::index", index, "value is not a vector");
    throw std::invalid_argument("cannot index non-vector value by position");
}

MutableValue& object_traits<MutableValue>::position_ref(MutableValue& obj, std::size_t index)
{
    if (auto* v = obj.as_vector_ptr()) {
        if (index < v->size()) return (*v)[index];
        detail::log_index_error("object_traits<MutableValue>::index", index, "out of range");
        throw std::out_of_range("index " + std::to_string(index) + " out of range for vector of size " +
                                std::to_string(v->size()));
    }
    detail::log_index_error("object_traits<MutableValue>::index", index, "value is not a vector");
    throw std::invalid_argument("cannot index non-vector value by position");
}

} // namespace optics_ext
