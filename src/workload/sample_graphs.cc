#include "sample_graphs.h"

namespace DeepBatch {
namespace Workload {

namespace {

ObjectRef IntRange(Heap& heap, int begin, int end) {
    ObjectRef list = heap.NewList();
    for (int i = begin; i < end; ++i) {
        list->Append(heap.NewInt(i));
    }
    return list;
}

void Put(Heap& heap, ObjectRef dict, const std::string& key, ObjectRef value) {
    dict->Insert(heap.NewString(key), value);
}

} // namespace

ObjectRef MakePerson(Heap& heap, const std::string& name, int age, int num_hobbies) {
    ObjectRef person = heap.NewRecord("Person");
    person->SetField("name", heap.NewString(name));
    person->SetField("age", heap.NewInt(age));
    ObjectRef hobbies = heap.NewList();
    for (int j = 0; j < num_hobbies; ++j) {
        hobbies->Append(heap.NewString("hobby" + std::to_string(j)));
    }
    person->SetField("hobbies", hobbies);
    return person;
}

std::vector<ObjectRef> BuildSampleGraphs(Heap& heap, int scale) {
    if (scale < 1) scale = 1;
    std::vector<ObjectRef> graphs;

    // Nested list
    ObjectRef nested_list = heap.NewList();
    for (int i = 0; i < 10 * scale; ++i) {
        nested_list->Append(IntRange(heap, 0, 10 * scale));
    }
    graphs.push_back(nested_list);

    // Nested dict
    ObjectRef nested_dict = heap.NewDict();
    for (int i = 0; i < 10 * scale; ++i) {
        ObjectRef inner = heap.NewDict();
        Put(heap, inner, "val", heap.NewInt(i));
        Put(heap, inner, "nested", IntRange(heap, i, i + 3));
        Put(heap, nested_dict, "key" + std::to_string(i), inner);
    }
    graphs.push_back(nested_dict);

    // Tuple of lists
    graphs.push_back(heap.NewTuple({IntRange(heap, 0, 5 * scale), IntRange(heap, 5 * scale, 10 * scale)}));

    // Dict with mixed values
    ObjectRef mixed = heap.NewDict();
    Put(heap, mixed, "nums", IntRange(heap, 0, 3 * scale));
    std::vector<ObjectRef> words;
    for (int j = 0; j < 3 * scale; ++j) {
        words.push_back(heap.NewString("w" + std::to_string(j)));
    }
    Put(heap, mixed, "words", heap.NewTuple(std::move(words)));
    Put(heap, mixed, "flag", heap.NewBool(true));
    Put(heap, mixed, "ratio", heap.NewFloat(0.5));
    Put(heap, mixed, "missing", heap.None());
    graphs.push_back(mixed);

    // List of dicts
    ObjectRef dict_list = heap.NewList();
    for (int i = 0; i < 10 * scale; ++i) {
        ObjectRef entry = heap.NewDict();
        Put(heap, entry, "id", heap.NewInt(i));
        Put(heap, entry, "val", heap.NewInt(static_cast<int64_t>(i) * i));
        dict_list->Append(entry);
    }
    graphs.push_back(dict_list);

    // List of records
    ObjectRef people = heap.NewList();
    for (int i = 0; i < 2 * scale; ++i) {
        people->Append(MakePerson(heap, "Person_" + std::to_string(i), 20 + i, 5 * scale));
    }
    graphs.push_back(people);

    // Nested combination
    ObjectRef combo = heap.NewDict();
    ObjectRef combo_list = IntRange(heap, 0, 2 * scale);
    for (int j = 0; j < 2 * scale; ++j) {
        ObjectRef inner = heap.NewDict();
        Put(heap, inner, "inner", heap.NewTuple({heap.NewInt(j), heap.NewInt(j + 1)}));
        combo_list->Append(inner);
    }
    Put(heap, combo, "list", combo_list);
    Put(heap, combo, "range", IntRange(heap, 0, 3 * scale));
    graphs.push_back(combo);

    // Strings
    ObjectRef strings = heap.NewList();
    for (int i = 0; i < 100 * scale; ++i) {
        strings->Append(heap.NewString("string_" + std::to_string(i)));
    }
    graphs.push_back(strings);

    // Dict of lists of dicts, keyed by int
    ObjectRef by_int = heap.NewDict();
    for (int i = 0; i < 5 * scale; ++i) {
        ObjectRef values = heap.NewList();
        for (int j = 0; j < 3 * scale; ++j) {
            ObjectRef inner = heap.NewDict();
            Put(heap, inner, "val", heap.NewInt(j));
            values->Append(inner);
        }
        by_int->Insert(heap.NewInt(i), values);
    }
    graphs.push_back(by_int);

    // Tuple of atomics; copies of it are the tuple itself
    graphs.push_back(heap.NewTuple({heap.NewInt(1), heap.NewString("two"), heap.NewFloat(3.0)}));

    return graphs;
}

std::vector<ObjectRef> BuildSharedGraphs(Heap& heap, int scale) {
    if (scale < 1) scale = 1;
    std::vector<ObjectRef> graphs;

    // One sublist reachable from every slot of every row
    ObjectRef shared_sublist = IntRange(heap, 0, 10 * scale);
    ObjectRef row = heap.NewList();
    for (int i = 0; i < 10 * scale; ++i) {
        row->Append(shared_sublist);
    }
    ObjectRef rows = heap.NewList();
    for (int i = 0; i < 5 * scale; ++i) {
        rows->Append(row);
    }
    graphs.push_back(rows);

    // Dicts sharing one tuple of mutable lists
    ObjectRef shared_tuple = heap.NewTuple({IntRange(heap, 0, 5 * scale), IntRange(heap, 5 * scale, 10 * scale)});
    ObjectRef dicts = heap.NewList();
    for (int i = 0; i < 10 * scale; ++i) {
        ObjectRef entry = heap.NewDict();
        Put(heap, entry, "a", shared_tuple);
        Put(heap, entry, "b", IntRange(heap, 0, 3 * scale));
        dicts->Append(entry);
    }
    graphs.push_back(dicts);

    // Records sharing one hobby list
    ObjectRef shared_hobbies = heap.NewList({heap.NewString("chess"), heap.NewString("rowing")});
    ObjectRef club = heap.NewList();
    for (int i = 0; i < 3 * scale; ++i) {
        ObjectRef person = MakePerson(heap, "Member_" + std::to_string(i), 30 + i, 0);
        person->SetField("hobbies", shared_hobbies);
        club->Append(person);
    }
    graphs.push_back(club);

    return graphs;
}

ObjectRef BuildCyclicGraph(Heap& heap, int num_children) {
    ObjectRef root = heap.NewDict();
    Put(heap, root, "name", heap.NewString("root"));
    Put(heap, root, "self", root);
    ObjectRef children = heap.NewList();
    for (int i = 0; i < num_children; ++i) {
        ObjectRef child = heap.NewRecord("Node");
        child->SetField("id", heap.NewInt(i));
        child->SetField("parent", root);
        children->Append(child);
    }
    Put(heap, root, "children", children);
    return root;
}

} // namespace Workload
} // namespace DeepBatch
