#include "proxy.h"

#include <stdexcept>

#include "batcher.h"
#include "object/graph_ops.h"

namespace DeepBatch {

Proxy::Proxy(Batcher* batcher, HandlePtr handle)
    : batcher_(batcher), handle_(std::move(handle)) {
    if (batcher_ == nullptr || !handle_) {
        throw std::invalid_argument("Proxy requires a batcher and a handle");
    }
}

ObjectRef Proxy::Resolve() const {
    return batcher_->Get(handle_);
}

ObjectRef Proxy::Target() const {
    ObjectRef target = Resolve();
    if (target == nullptr) {
        throw std::invalid_argument("proxy resolved to a null object");
    }
    return target;
}

ObjectKind Proxy::Kind() const {
    return Target()->kind();
}

size_t Proxy::Size() const {
    return Target()->Size();
}

ObjectRef Proxy::At(size_t index) const {
    return Target()->At(index);
}

void Proxy::SetAt(size_t index, ObjectRef value) const {
    Target()->SetAt(index, value);
}

ObjectRef Proxy::Lookup(const std::string& key) const {
    ObjectRef value = Target()->Lookup(key);
    if (value == nullptr) {
        throw std::out_of_range("key '" + key + "' not found");
    }
    return value;
}

ObjectRef Proxy::Lookup(const Object& key) const {
    ObjectRef value = Target()->Lookup(key);
    if (value == nullptr) {
        throw std::out_of_range("key " + DeepBatch::Repr(&key) + " not found");
    }
    return value;
}

void Proxy::Insert(ObjectRef key, ObjectRef value) const {
    Target()->Insert(key, value);
}

ObjectRef Proxy::Field(const std::string& name) const {
    ObjectRef value = Target()->GetField(name);
    if (value == nullptr) {
        throw std::out_of_range("record has no field '" + name + "'");
    }
    return value;
}

void Proxy::SetField(const std::string& name, ObjectRef value) const {
    Target()->SetField(name, value);
}

const std::vector<ObjectRef>& Proxy::IterationRange() const {
    ObjectRef target = Target();
    switch (target->kind()) {
        case ObjectKind::kList:
        case ObjectKind::kTuple:
            return target->items();
        case ObjectKind::kDict:
            return target->keys();
        default:
            throw std::invalid_argument(std::string("object of kind ") + DeepBatch::ToString(target->kind()) +
                                        " is not iterable");
    }
}

Proxy::const_iterator Proxy::begin() const {
    return IterationRange().begin();
}

Proxy::const_iterator Proxy::end() const {
    return IterationRange().end();
}

Proxy::operator bool() const {
    return Target()->Truthy();
}

std::string Proxy::ToString() const {
    return DeepBatch::Repr(Resolve());
}

std::string Proxy::Repr() const {
    if (!handle_->IsReady()) {
        return "<LazyDeepCopy unresolved>";
    }
    return DeepBatch::Repr(handle_->Peek());
}

} // namespace DeepBatch
