#include "graph_copier.h"

#include <glog/logging.h>

#include "common/errors.h"
#include "graph_ops.h"

namespace DeepBatch {

std::vector<ObjectRef> GraphCopier::CopyMany(const std::vector<ObjectRef>& roots) {
    // One memo for the whole call, so identity shared between roots is
    // shared between outputs.
    Memo memo;
    std::vector<ObjectRef> outputs;
    outputs.reserve(roots.size());
    for (ObjectRef root : roots) {
        outputs.push_back(CopyNode(root, memo, 0));
    }
    VLOG(3) << "GraphCopier copied " << roots.size() << " roots, " << memo.size() << " nodes memoized";
    return outputs;
}

size_t GraphCopier::EstimateBytes(ObjectRef root) const {
    return DeepBatch::EstimateBytes(root);
}

ObjectRef GraphCopier::CopyNode(ObjectRef source, Memo& memo, size_t depth) {
    if (source == nullptr || source->IsAtomic()) {
        return source;
    }

    auto it = memo.find(source);
    if (it != memo.end()) {
        return it->second;
    }

    if (depth >= kMaxDepth) {
        throw CopyError("maximum depth " + std::to_string(kMaxDepth) +
                        " exceeded while copying a " + ToString(source->kind()));
    }

    switch (source->kind()) {
        case ObjectKind::kList: {
            ObjectRef copy = heap_.NewList();
            memo.emplace(source, copy);
            for (ObjectRef item : source->items()) {
                copy->Append(CopyNode(item, memo, depth + 1));
            }
            return copy;
        }
        case ObjectKind::kDict: {
            ObjectRef copy = heap_.NewDict();
            memo.emplace(source, copy);
            for (size_t i = 0; i < source->keys().size(); ++i) {
                copy->Insert(source->keys()[i], CopyNode(source->items()[i], memo, depth + 1));
            }
            return copy;
        }
        case ObjectKind::kRecord: {
            ObjectRef copy = heap_.NewRecord(source->type_name());
            memo.emplace(source, copy);
            for (size_t i = 0; i < source->field_names().size(); ++i) {
                copy->SetField(source->field_names()[i], CopyNode(source->items()[i], memo, depth + 1));
            }
            return copy;
        }
        case ObjectKind::kTuple: {
            std::vector<ObjectRef> items;
            items.reserve(source->items().size());
            bool changed = false;
            for (ObjectRef item : source->items()) {
                ObjectRef copied = CopyNode(item, memo, depth + 1);
                changed |= copied != item;
                items.push_back(copied);
            }
            // A cycle through a mutable child may already have copied us.
            auto again = memo.find(source);
            if (again != memo.end()) {
                return again->second;
            }
            ObjectRef copy = changed ? heap_.NewTuple(std::move(items)) : source;
            memo.emplace(source, copy);
            return copy;
        }
        case ObjectKind::kResource:
            throw CopyError("cannot deep-copy resource '" + source->type_name() + "'");
        default:
            throw CopyError(std::string("cannot deep-copy object of kind ") + ToString(source->kind()));
    }
}

} // namespace DeepBatch
