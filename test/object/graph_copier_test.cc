#include <gtest/gtest.h>
#include "../../src/object/graph_copier.h"
#include "../../src/object/graph_ops.h"
#include "../../src/common/errors.h"
#include "../../src/workload/sample_graphs.h"
#include <chrono>

using namespace DeepBatch;

class GraphCopierTest : public ::testing::Test {
protected:
    void SetUp() override {
        copier_ = std::make_unique<GraphCopier>(heap_);
    }

    Heap heap_;
    std::unique_ptr<GraphCopier> copier_;
};

TEST_F(GraphCopierTest, CopiesMutableContainers) {
    ObjectRef inner = heap_.NewList({heap_.NewInt(1), heap_.NewInt(2)});
    ObjectRef source = heap_.NewDict();
    source->Insert(heap_.NewString("a"), inner);
    source->Insert(heap_.NewString("b"), heap_.NewDict());

    ObjectRef copy = copier_->CopyOne(source);

    EXPECT_TRUE(DeepEquals(source, copy));
    EXPECT_NE(copy, source);
    EXPECT_NE(copy->Lookup("a"), inner);
    EXPECT_NE(copy->Lookup("b"), source->Lookup("b"));
}

TEST_F(GraphCopierTest, AtomicsAreShared) {
    ObjectRef text = heap_.NewString("immutable");
    ObjectRef source = heap_.NewList({text});

    ObjectRef copy = copier_->CopyOne(source);
    EXPECT_EQ(copy->At(0), text);
    EXPECT_EQ(copier_->CopyOne(text), text);
}

TEST_F(GraphCopierTest, TupleOfAtomicsIsReused) {
    ObjectRef tuple = heap_.NewTuple({heap_.NewInt(1), heap_.NewString("x")});
    EXPECT_EQ(copier_->CopyOne(tuple), tuple);
}

TEST_F(GraphCopierTest, TupleWithMutableChildIsRebuilt) {
    ObjectRef list = heap_.NewList({heap_.NewInt(1)});
    ObjectRef tuple = heap_.NewTuple({list, heap_.NewInt(2)});

    ObjectRef copy = copier_->CopyOne(tuple);
    EXPECT_NE(copy, tuple);
    EXPECT_NE(copy->At(0), list);
    EXPECT_EQ(copy->At(1), tuple->At(1));
    EXPECT_TRUE(DeepEquals(tuple, copy));
}

TEST_F(GraphCopierTest, SelfReferentialListStaysCyclic) {
    ObjectRef list = heap_.NewList({heap_.NewInt(1)});
    list->Append(list);

    ObjectRef copy = copier_->CopyOne(list);
    ASSERT_EQ(copy->Size(), 2u);
    EXPECT_EQ(copy->At(1), copy);
    EXPECT_NE(copy, list);
}

TEST_F(GraphCopierTest, CycleThroughTupleResolvesToOneCopy) {
    ObjectRef list = heap_.NewList();
    ObjectRef tuple = heap_.NewTuple({list});
    list->Append(tuple);

    ObjectRef copy = copier_->CopyOne(tuple);
    ObjectRef copied_list = copy->At(0);
    EXPECT_NE(copied_list, list);
    EXPECT_EQ(copied_list->At(0), copy);
}

TEST_F(GraphCopierTest, RecordBackEdges) {
    ObjectRef root = Workload::BuildCyclicGraph(heap_, 3);

    ObjectRef copy = copier_->CopyOne(root);
    EXPECT_EQ(copy->Lookup("self"), copy);
    ObjectRef children = copy->Lookup("children");
    ASSERT_EQ(children->Size(), 3u);
    for (ObjectRef child : children->items()) {
        EXPECT_EQ(child->GetField("parent"), copy);
    }
    EXPECT_TRUE(DeepEquals(root, copy));
}

TEST_F(GraphCopierTest, IdenticalRootsShareOutput) {
    ObjectRef source = heap_.NewList({heap_.NewInt(1)});
    ObjectRef other = heap_.NewList({heap_.NewInt(1)});

    auto outputs = copier_->CopyMany({source, other, source});
    ASSERT_EQ(outputs.size(), 3u);
    EXPECT_EQ(outputs[0], outputs[2]);
    EXPECT_NE(outputs[0], outputs[1]);
}

TEST_F(GraphCopierTest, SubstructureSharedAcrossRootsIsShared) {
    ObjectRef shared = heap_.NewList({heap_.NewInt(9)});
    ObjectRef a = heap_.NewList({shared});
    ObjectRef b = heap_.NewDict();
    b->Insert(heap_.NewString("s"), shared);

    auto outputs = copier_->CopyMany({a, b});
    EXPECT_EQ(outputs[0]->At(0), outputs[1]->Lookup("s"));
    EXPECT_NE(outputs[0]->At(0), shared);

    // Separate calls do not share.
    EXPECT_NE(copier_->CopyOne(a)->At(0), copier_->CopyOne(b)->Lookup("s"));
}

TEST_F(GraphCopierTest, SampleGraphsRoundTrip) {
    for (ObjectRef graph : Workload::BuildSampleGraphs(heap_, 2)) {
        EXPECT_TRUE(DeepEquals(graph, copier_->CopyOne(graph))) << Repr(graph).substr(0, 60);
    }
}

TEST_F(GraphCopierTest, SharedGraphsKeepInternalAliasing) {
    auto graphs = Workload::BuildSharedGraphs(heap_, 1);
    ObjectRef rows = copier_->CopyOne(graphs[0]);
    EXPECT_EQ(rows->At(0), rows->At(1));
    EXPECT_EQ(rows->At(0)->At(0), rows->At(0)->At(1));
    EXPECT_NE(rows->At(0)->At(0), graphs[0]->At(0)->At(0));
}

TEST_F(GraphCopierTest, ResourceIsUncopyable) {
    ObjectRef source = heap_.NewList({heap_.NewInt(1), heap_.NewResource("lock")});
    EXPECT_THROW(copier_->CopyOne(source), CopyError);
    EXPECT_THROW(copier_->CopyMany({heap_.NewList(), source}), CopyError);
}

TEST_F(GraphCopierTest, DepthLimitRaisesCopyError) {
    ObjectRef deepest = heap_.NewList();
    ObjectRef current = deepest;
    for (size_t i = 0; i < GraphCopier::kMaxDepth + 10; ++i) {
        current = heap_.NewList({current});
    }
    EXPECT_THROW(copier_->CopyOne(current), CopyError);

    ObjectRef shallow = deepest;
    for (int i = 0; i < 100; ++i) {
        shallow = heap_.NewList({shallow});
    }
    EXPECT_NO_THROW(copier_->CopyOne(shallow));
}

TEST_F(GraphCopierTest, NullRootCopiesToNull) {
    EXPECT_EQ(copier_->CopyOne(nullptr), nullptr);
}

TEST_F(GraphCopierTest, EstimateBytesIsPositive) {
    ObjectRef graph = Workload::BuildSampleGraphs(heap_, 1).front();
    EXPECT_GT(copier_->EstimateBytes(graph), 0u);
}

TEST_F(GraphCopierTest, LargeDictCopiesInLinearTime) {
    const int64_t num_keys = 50000;
    ObjectRef source = heap_.NewDict();
    for (int64_t i = 0; i < num_keys; ++i) {
        source->Insert(heap_.NewInt(i), heap_.NewList({heap_.NewInt(i)}));
    }
    ObjectRef named = heap_.NewDict();
    for (int64_t i = 0; i < num_keys; ++i) {
        named->Insert(heap_.NewString("key" + std::to_string(i)), heap_.NewInt(i));
    }

    auto start = std::chrono::steady_clock::now();
    auto outputs = copier_->CopyMany({source, named});
    bool equal = DeepEquals(source, outputs[0]) && DeepEquals(named, outputs[1]);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_TRUE(equal);
    ASSERT_EQ(outputs[0]->Size(), static_cast<size_t>(num_keys));
    EXPECT_EQ(outputs[0]->Lookup(*heap_.NewInt(num_keys - 1))->At(0)->AsInt(), num_keys - 1);
    EXPECT_NE(outputs[0]->Lookup(*heap_.NewInt(7)), source->Lookup(*heap_.NewInt(7)));
    EXPECT_EQ(outputs[1]->Lookup("key12345")->AsInt(), 12345);
    // A scan per key takes tens of seconds at this size.
    EXPECT_LT(elapsed_ms, 5000);
}
