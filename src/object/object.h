#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace DeepBatch {

enum class ObjectKind {
    kNone,
    kBool,
    kInt,
    kFloat,
    kString,
    kList,
    kTuple,
    kDict,
    kRecord,
    kResource,
};

const char* ToString(ObjectKind kind);

class Object;
class Heap;

// Object references are plain pointers into a Heap. Two references are
// identical iff they point at the same object.
using ObjectRef = Object*;

// Hash and equality of atomic dict keys by kind and value. Transparent over
// std::string_view so string lookups need no temporary key object.
struct AtomicKeyHash {
    using is_transparent = void;
    size_t operator()(const Object* key) const;
    size_t operator()(std::string_view key) const;
};

struct AtomicKeyEq {
    using is_transparent = void;
    bool operator()(const Object* a, const Object* b) const;
    bool operator()(const Object* a, std::string_view b) const;
    bool operator()(std::string_view a, const Object* b) const { return (*this)(b, a); }
};

/**
 * A dynamically typed node of an object graph.
 *
 * Atomic kinds (none, bool, int, float, string) are immutable. Lists, dicts
 * and records are mutable and may form cycles. Tuples are fixed at
 * construction. Resources stand for external state (locks, files) and cannot
 * be deep-copied.
 *
 * Objects are owned by the Heap that allocated them. Mutation is not
 * synchronized; callers own concurrent access to the objects they mutate.
 */
class Object {
public:
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    ObjectKind kind() const { return kind_; }
    bool IsAtomic() const;

    // Scalar accessors. Throw std::invalid_argument on a kind mismatch.
    bool AsBool() const;
    int64_t AsInt() const;
    double AsFloat() const;
    const std::string& AsString() const;

    // Record type name or resource tag; empty for other kinds.
    const std::string& type_name() const { return type_name_; }

    // Number of elements (list, tuple), entries (dict), fields (record) or
    // characters (string).
    size_t Size() const;

    // Sequence access (list, tuple). Throw std::out_of_range on a bad index.
    ObjectRef At(size_t index) const;
    void SetAt(size_t index, ObjectRef value);  // list only
    void Append(ObjectRef value);               // list only

    // Dict access. Keys must be atomic and compare by kind and value.
    // Lookup returns nullptr when the key is absent.
    ObjectRef Lookup(const Object& key) const;
    ObjectRef Lookup(const std::string& key) const;
    void Insert(ObjectRef key, ObjectRef value);

    // Record access. GetField returns nullptr when the field is absent.
    ObjectRef GetField(const std::string& name) const;
    void SetField(const std::string& name, ObjectRef value);
    const std::vector<std::string>& field_names() const { return field_names_; }

    // Elements of a list or tuple, values of a dict (parallel to keys()),
    // field values of a record (parallel to field_names()).
    const std::vector<ObjectRef>& items() const { return items_; }
    // Keys of a dict, in insertion order.
    const std::vector<ObjectRef>& keys() const { return keys_; }

    // Truthiness: none, false, zero, empty string and empty containers are
    // false. Records and resources are always true.
    bool Truthy() const;

private:
    friend class Heap;

    using Scalar = std::variant<std::monostate, bool, int64_t, double, std::string>;

    Object(ObjectKind kind, Scalar scalar) : kind_(kind), scalar_(std::move(scalar)) {}

    void RequireKind(ObjectKind expected, const char* op) const;

    const ObjectKind kind_;
    const Scalar scalar_;
    std::string type_name_;
    std::vector<ObjectRef> items_;
    std::vector<ObjectRef> keys_;
    // Dict only: key value -> position in keys_ / items_.
    absl::flat_hash_map<const Object*, size_t, AtomicKeyHash, AtomicKeyEq> key_index_;
    std::vector<std::string> field_names_;
};

// Value equality of two atomic objects (same kind and same value).
bool AtomicEquals(const Object& a, const Object& b);

/**
 * Owns every object it allocates until the heap is destroyed, so cyclic
 * graphs need no reference counting. Allocation is thread-safe.
 */
class Heap {
public:
    Heap();
    ~Heap();

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    // The shared None object.
    ObjectRef None() const { return none_; }

    ObjectRef NewBool(bool value);
    ObjectRef NewInt(int64_t value);
    ObjectRef NewFloat(double value);
    ObjectRef NewString(std::string value);
    ObjectRef NewList(std::vector<ObjectRef> items = {});
    ObjectRef NewTuple(std::vector<ObjectRef> items);
    ObjectRef NewDict();
    ObjectRef NewRecord(std::string type_name);
    ObjectRef NewResource(std::string tag);

    size_t size() const;

private:
    ObjectRef Allocate(ObjectKind kind, Object::Scalar scalar);

    mutable absl::Mutex mutex_;
    std::vector<std::unique_ptr<Object>> objects_ ABSL_GUARDED_BY(mutex_);
    ObjectRef none_;
};

} // namespace DeepBatch
