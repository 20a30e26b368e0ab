#pragma once

#include <string>
#include <vector>

#include "object/object.h"

namespace DeepBatch {
namespace Workload {

// Person(name, age, hobbies) record.
ObjectRef MakePerson(Heap& heap, const std::string& name, int age, int num_hobbies);

/**
 * Ten representative graphs, sized by scale >= 1: nested lists, nested
 * dicts, a tuple of lists, a dict of mixed values, a list of dicts, a list of
 * records, a mixed nested structure, a list of strings, a dict of lists of
 * dicts, and a tuple of atomics.
 */
std::vector<ObjectRef> BuildSampleGraphs(Heap& heap, int scale);

// Graphs in which mutable substructure is reachable from many places.
std::vector<ObjectRef> BuildSharedGraphs(Heap& heap, int scale);

// A dict whose 'self' entry points back at itself and whose 'children' list
// holds records pointing back at the dict.
ObjectRef BuildCyclicGraph(Heap& heap, int num_children);

} // namespace Workload
} // namespace DeepBatch
