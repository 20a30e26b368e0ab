#include "object.h"

#include <stdexcept>
#include <utility>

#include "absl/hash/hash.h"

namespace DeepBatch {

const char* ToString(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::kNone: return "none";
        case ObjectKind::kBool: return "bool";
        case ObjectKind::kInt: return "int";
        case ObjectKind::kFloat: return "float";
        case ObjectKind::kString: return "string";
        case ObjectKind::kList: return "list";
        case ObjectKind::kTuple: return "tuple";
        case ObjectKind::kDict: return "dict";
        case ObjectKind::kRecord: return "record";
        case ObjectKind::kResource: return "resource";
    }
    return "unknown";
}

bool Object::IsAtomic() const {
    switch (kind_) {
        case ObjectKind::kNone:
        case ObjectKind::kBool:
        case ObjectKind::kInt:
        case ObjectKind::kFloat:
        case ObjectKind::kString:
            return true;
        default:
            return false;
    }
}

void Object::RequireKind(ObjectKind expected, const char* op) const {
    if (kind_ != expected) {
        throw std::invalid_argument(std::string(op) + " requires a " + ToString(expected) +
                                    ", got " + ToString(kind_));
    }
}

bool Object::AsBool() const {
    RequireKind(ObjectKind::kBool, "AsBool");
    return std::get<bool>(scalar_);
}

int64_t Object::AsInt() const {
    RequireKind(ObjectKind::kInt, "AsInt");
    return std::get<int64_t>(scalar_);
}

double Object::AsFloat() const {
    RequireKind(ObjectKind::kFloat, "AsFloat");
    return std::get<double>(scalar_);
}

const std::string& Object::AsString() const {
    RequireKind(ObjectKind::kString, "AsString");
    return std::get<std::string>(scalar_);
}

size_t Object::Size() const {
    switch (kind_) {
        case ObjectKind::kString:
            return std::get<std::string>(scalar_).size();
        case ObjectKind::kList:
        case ObjectKind::kTuple:
        case ObjectKind::kDict:
        case ObjectKind::kRecord:
            return items_.size();
        default:
            throw std::invalid_argument(std::string("object of kind ") + ToString(kind_) +
                                        " has no size");
    }
}

ObjectRef Object::At(size_t index) const {
    if (kind_ != ObjectKind::kList && kind_ != ObjectKind::kTuple) {
        throw std::invalid_argument(std::string("object of kind ") + ToString(kind_) +
                                    " is not indexable");
    }
    if (index >= items_.size()) {
        throw std::out_of_range("index " + std::to_string(index) + " out of range for " +
                                ToString(kind_) + " of size " + std::to_string(items_.size()));
    }
    return items_[index];
}

void Object::SetAt(size_t index, ObjectRef value) {
    RequireKind(ObjectKind::kList, "SetAt");
    if (index >= items_.size()) {
        throw std::out_of_range("assignment index " + std::to_string(index) +
                                " out of range for list of size " + std::to_string(items_.size()));
    }
    items_[index] = value;
}

void Object::Append(ObjectRef value) {
    RequireKind(ObjectKind::kList, "Append");
    items_.push_back(value);
}

ObjectRef Object::Lookup(const Object& key) const {
    RequireKind(ObjectKind::kDict, "Lookup");
    auto it = key_index_.find(&key);
    return it == key_index_.end() ? nullptr : items_[it->second];
}

ObjectRef Object::Lookup(const std::string& key) const {
    RequireKind(ObjectKind::kDict, "Lookup");
    auto it = key_index_.find(std::string_view(key));
    return it == key_index_.end() ? nullptr : items_[it->second];
}

void Object::Insert(ObjectRef key, ObjectRef value) {
    RequireKind(ObjectKind::kDict, "Insert");
    if (key == nullptr || !key->IsAtomic()) {
        throw std::invalid_argument("dict keys must be atomic objects");
    }
    auto [it, inserted] = key_index_.try_emplace(key, keys_.size());
    if (!inserted) {
        items_[it->second] = value;
        return;
    }
    keys_.push_back(key);
    items_.push_back(value);
}

ObjectRef Object::GetField(const std::string& name) const {
    RequireKind(ObjectKind::kRecord, "GetField");
    for (size_t i = 0; i < field_names_.size(); ++i) {
        if (field_names_[i] == name) {
            return items_[i];
        }
    }
    return nullptr;
}

void Object::SetField(const std::string& name, ObjectRef value) {
    RequireKind(ObjectKind::kRecord, "SetField");
    for (size_t i = 0; i < field_names_.size(); ++i) {
        if (field_names_[i] == name) {
            items_[i] = value;
            return;
        }
    }
    field_names_.push_back(name);
    items_.push_back(value);
}

bool Object::Truthy() const {
    switch (kind_) {
        case ObjectKind::kNone: return false;
        case ObjectKind::kBool: return std::get<bool>(scalar_);
        case ObjectKind::kInt: return std::get<int64_t>(scalar_) != 0;
        case ObjectKind::kFloat: return std::get<double>(scalar_) != 0.0;
        case ObjectKind::kString: return !std::get<std::string>(scalar_).empty();
        case ObjectKind::kList:
        case ObjectKind::kTuple:
        case ObjectKind::kDict:
            return !items_.empty();
        case ObjectKind::kRecord:
        case ObjectKind::kResource:
            return true;
    }
    return true;
}

size_t AtomicKeyHash::operator()(std::string_view key) const {
    return absl::Hash<std::pair<int, std::string_view>>()(
        {static_cast<int>(ObjectKind::kString), key});
}

size_t AtomicKeyHash::operator()(const Object* key) const {
    int kind = static_cast<int>(key->kind());
    switch (key->kind()) {
        case ObjectKind::kNone:
            return absl::Hash<int>()(kind);
        case ObjectKind::kBool:
            return absl::Hash<std::pair<int, bool>>()({kind, key->AsBool()});
        case ObjectKind::kInt:
            return absl::Hash<std::pair<int, int64_t>>()({kind, key->AsInt()});
        case ObjectKind::kFloat: {
            // 0.0 and -0.0 compare equal and must hash alike.
            double value = key->AsFloat();
            return absl::Hash<std::pair<int, double>>()({kind, value == 0.0 ? 0.0 : value});
        }
        case ObjectKind::kString:
            return (*this)(std::string_view(key->AsString()));
        default:
            return absl::Hash<const Object*>()(key);
    }
}

bool AtomicKeyEq::operator()(const Object* a, const Object* b) const {
    return AtomicEquals(*a, *b);
}

bool AtomicKeyEq::operator()(const Object* a, std::string_view b) const {
    return a->kind() == ObjectKind::kString && a->AsString() == b;
}

bool AtomicEquals(const Object& a, const Object& b) {
    if (&a == &b) return true;
    if (a.kind() != b.kind() || !a.IsAtomic()) return false;
    switch (a.kind()) {
        case ObjectKind::kNone: return true;
        case ObjectKind::kBool: return a.AsBool() == b.AsBool();
        case ObjectKind::kInt: return a.AsInt() == b.AsInt();
        case ObjectKind::kFloat: return a.AsFloat() == b.AsFloat();
        case ObjectKind::kString: return a.AsString() == b.AsString();
        default: return false;
    }
}

Heap::Heap() {
    none_ = Allocate(ObjectKind::kNone, std::monostate{});
}

Heap::~Heap() = default;

ObjectRef Heap::Allocate(ObjectKind kind, Object::Scalar scalar) {
    std::unique_ptr<Object> object(new Object(kind, std::move(scalar)));
    ObjectRef ref = object.get();
    absl::MutexLock lock(&mutex_);
    objects_.push_back(std::move(object));
    return ref;
}

ObjectRef Heap::NewBool(bool value) {
    return Allocate(ObjectKind::kBool, value);
}

ObjectRef Heap::NewInt(int64_t value) {
    return Allocate(ObjectKind::kInt, value);
}

ObjectRef Heap::NewFloat(double value) {
    return Allocate(ObjectKind::kFloat, value);
}

ObjectRef Heap::NewString(std::string value) {
    return Allocate(ObjectKind::kString, std::move(value));
}

ObjectRef Heap::NewList(std::vector<ObjectRef> items) {
    ObjectRef list = Allocate(ObjectKind::kList, std::monostate{});
    list->items_ = std::move(items);
    return list;
}

ObjectRef Heap::NewTuple(std::vector<ObjectRef> items) {
    ObjectRef tuple = Allocate(ObjectKind::kTuple, std::monostate{});
    tuple->items_ = std::move(items);
    return tuple;
}

ObjectRef Heap::NewDict() {
    return Allocate(ObjectKind::kDict, std::monostate{});
}

ObjectRef Heap::NewRecord(std::string type_name) {
    ObjectRef record = Allocate(ObjectKind::kRecord, std::monostate{});
    record->type_name_ = std::move(type_name);
    return record;
}

ObjectRef Heap::NewResource(std::string tag) {
    ObjectRef resource = Allocate(ObjectKind::kResource, std::monostate{});
    resource->type_name_ = std::move(tag);
    return resource;
}

size_t Heap::size() const {
    absl::MutexLock lock(&mutex_);
    return objects_.size();
}

} // namespace DeepBatch
