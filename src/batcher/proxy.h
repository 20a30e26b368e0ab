#pragma once

#include <string>
#include <vector>

#include "handle.h"
#include "object/object.h"

namespace DeepBatch {

class Batcher;

/**
 * Lazy stand-in for a deferred copy.
 *
 * Every value operation resolves the handle through Batcher::Get first, which
 * flushes the whole pending batch when the handle is still pending, then
 * applies the operation to the resolved object. IsMaterialized() and Repr()
 * never force resolution.
 *
 * A Proxy holds no value of its own. Copies of a Proxy share its handle. The
 * Batcher must outlive its proxies.
 */
class Proxy {
public:
    using const_iterator = std::vector<ObjectRef>::const_iterator;

    Proxy(Batcher* batcher, HandlePtr handle);

    // Force resolution and return the copied object.
    ObjectRef Resolve() const;

    bool IsMaterialized() const { return handle_->IsReady(); }
    const HandlePtr& handle() const { return handle_; }

    ObjectKind Kind() const;
    size_t Size() const;

    // Indexed access on a list or tuple; assignment on a list.
    ObjectRef At(size_t index) const;
    void SetAt(size_t index, ObjectRef value) const;

    // Keyed access on a dict. Lookup() throws std::out_of_range for a missing key.
    ObjectRef Lookup(const std::string& key) const;
    ObjectRef Lookup(const Object& key) const;
    void Insert(ObjectRef key, ObjectRef value) const;

    // Member access on a record. Field() throws std::out_of_range for a missing field.
    ObjectRef Field(const std::string& name) const;
    void SetField(const std::string& name, ObjectRef value) const;

    // Iterates list/tuple elements or dict keys.
    const_iterator begin() const;
    const_iterator end() const;

    explicit operator bool() const;

    // Printable form of the resolved value.
    std::string ToString() const;

    // "<LazyDeepCopy unresolved>" while pending, otherwise the value's printable form.
    std::string Repr() const;

private:
    ObjectRef Target() const;
    const std::vector<ObjectRef>& IterationRange() const;

    Batcher* batcher_;
    HandlePtr handle_;
};

} // namespace DeepBatch
