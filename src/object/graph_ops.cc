#include "graph_ops.h"

#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"

namespace DeepBatch {

namespace {

using ComparedPairs = absl::flat_hash_set<std::pair<const Object*, const Object*>>;

bool DeepEqualsImpl(const Object* a, const Object* b, ComparedPairs& compared) {
    if (a == b) return true;
    if (a == nullptr || b == nullptr) return false;
    if (a->kind() != b->kind()) return false;
    if (a->IsAtomic()) return AtomicEquals(*a, *b);

    // Coinductive step: a pair already compared anywhere in this call is
    // assumed equal. Any mismatch returns false at once, so the assumption
    // only ever closes cycles.
    if (!compared.insert({a, b}).second) {
        return true;
    }

    switch (a->kind()) {
        case ObjectKind::kList:
        case ObjectKind::kTuple: {
            if (a->items().size() != b->items().size()) return false;
            for (size_t i = 0; i < a->items().size(); ++i) {
                if (!DeepEqualsImpl(a->items()[i], b->items()[i], compared)) return false;
            }
            return true;
        }
        case ObjectKind::kDict: {
            if (a->keys().size() != b->keys().size()) return false;
            for (size_t i = 0; i < a->keys().size(); ++i) {
                ObjectRef other = b->Lookup(*a->keys()[i]);
                if (other == nullptr) return false;
                if (!DeepEqualsImpl(a->items()[i], other, compared)) return false;
            }
            return true;
        }
        case ObjectKind::kRecord: {
            if (a->type_name() != b->type_name()) return false;
            if (a->field_names() != b->field_names()) return false;
            for (size_t i = 0; i < a->items().size(); ++i) {
                if (!DeepEqualsImpl(a->items()[i], b->items()[i], compared)) return false;
            }
            return true;
        }
        default:
            // Resources are only equal to themselves.
            return false;
    }
}

std::string QuoteString(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    out += "'";
    return out;
}

std::string FloatRepr(double value) {
    std::ostringstream os;
    os << std::setprecision(15) << value;
    std::string out = os.str();
    if (out.find_first_of(".eni") == std::string::npos) {
        out += ".0";
    }
    return out;
}

void ReprImpl(const Object* object, absl::flat_hash_set<const Object*>& active, std::string& out) {
    if (object == nullptr) {
        out += "<null>";
        return;
    }

    switch (object->kind()) {
        case ObjectKind::kNone: out += "None"; return;
        case ObjectKind::kBool: out += object->AsBool() ? "True" : "False"; return;
        case ObjectKind::kInt: out += std::to_string(object->AsInt()); return;
        case ObjectKind::kFloat: out += FloatRepr(object->AsFloat()); return;
        case ObjectKind::kString: out += QuoteString(object->AsString()); return;
        case ObjectKind::kResource: out += "<resource " + object->type_name() + ">"; return;
        default: break;
    }

    if (active.contains(object)) {
        switch (object->kind()) {
            case ObjectKind::kList: out += "[...]"; break;
            case ObjectKind::kTuple: out += "(...)"; break;
            case ObjectKind::kDict: out += "{...}"; break;
            default: out += object->type_name() + "(...)"; break;
        }
        return;
    }
    active.insert(object);

    const auto& items = object->items();
    switch (object->kind()) {
        case ObjectKind::kList:
        case ObjectKind::kTuple: {
            bool is_list = object->kind() == ObjectKind::kList;
            out += is_list ? "[" : "(";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ", ";
                ReprImpl(items[i], active, out);
            }
            if (!is_list && items.size() == 1) out += ",";
            out += is_list ? "]" : ")";
            break;
        }
        case ObjectKind::kDict: {
            out += "{";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ", ";
                ReprImpl(object->keys()[i], active, out);
                out += ": ";
                ReprImpl(items[i], active, out);
            }
            out += "}";
            break;
        }
        default: {
            out += object->type_name() + "(";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ", ";
                out += object->field_names()[i] + "=";
                ReprImpl(items[i], active, out);
            }
            out += ")";
            break;
        }
    }

    active.erase(object);
}

} // namespace

bool DeepEquals(const Object* a, const Object* b) {
    ComparedPairs compared;
    return DeepEqualsImpl(a, b, compared);
}

std::string Repr(const Object* object) {
    absl::flat_hash_set<const Object*> active;
    std::string out;
    ReprImpl(object, active, out);
    return out;
}

size_t EstimateBytes(const Object* root) {
    if (root == nullptr) return 0;

    size_t total = 0;
    absl::flat_hash_set<const Object*> seen;
    std::vector<const Object*> stack{root};
    while (!stack.empty()) {
        const Object* object = stack.back();
        stack.pop_back();
        if (object == nullptr || !seen.insert(object).second) continue;

        total += sizeof(Object);
        total += object->type_name().size();
        if (object->kind() == ObjectKind::kString) {
            total += object->AsString().size();
        }
        total += (object->items().size() + object->keys().size()) * sizeof(ObjectRef);
        for (const auto& name : object->field_names()) {
            total += sizeof(std::string) + name.size();
        }

        for (ObjectRef child : object->items()) stack.push_back(child);
        for (ObjectRef key : object->keys()) stack.push_back(key);
    }
    return total;
}

} // namespace DeepBatch
