#include <gtest/gtest.h>
#include "../../src/batcher/batcher.h"
#include "../../src/common/errors.h"
#include "../../src/object/graph_copier.h"
#include "../../src/object/graph_ops.h"
#include "../../src/workload/sample_graphs.h"

using namespace DeepBatch;

class ProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        batcher_ = std::make_unique<Batcher>(std::make_shared<GraphCopier>(heap_));
    }

    Heap heap_;
    std::unique_ptr<Batcher> batcher_;
};

TEST_F(ProxyTest, NotMaterializedUntilAccessed) {
    ObjectRef original = heap_.NewList({heap_.NewInt(1), heap_.NewInt(2)});
    Proxy proxy = batcher_->DeferProxy(original);

    EXPECT_FALSE(proxy.IsMaterialized());
    EXPECT_EQ(proxy.Repr(), "<LazyDeepCopy unresolved>");
    EXPECT_FALSE(proxy.IsMaterialized());
    EXPECT_EQ(batcher_->PendingCount(), 1u);

    EXPECT_EQ(proxy.Size(), 2u);
    EXPECT_TRUE(proxy.IsMaterialized());
    EXPECT_EQ(proxy.Repr(), "[1, 2]");
}

TEST_F(ProxyTest, OneAccessResolvesWholeBatch) {
    Proxy first = batcher_->DeferProxy(heap_.NewList({heap_.NewInt(1)}));
    Proxy second = batcher_->DeferProxy(heap_.NewList({heap_.NewInt(2)}));
    HandlePtr third = batcher_->Defer(heap_.NewDict());

    EXPECT_EQ(first.At(0)->AsInt(), 1);
    EXPECT_TRUE(second.IsMaterialized());
    EXPECT_TRUE(third->IsReady());
    EXPECT_EQ(batcher_->GetStats().flushes, 1u);
}

TEST_F(ProxyTest, MutationsTouchOnlyTheCopy) {
    ObjectRef original = heap_.NewList({heap_.NewInt(1), heap_.NewInt(2), heap_.NewInt(3)});
    Proxy proxy = batcher_->DeferProxy(original);

    proxy.SetAt(0, heap_.NewInt(99));
    EXPECT_EQ(proxy.At(0)->AsInt(), 99);
    EXPECT_EQ(original->At(0)->AsInt(), 1);
    EXPECT_THROW(proxy.At(3), std::out_of_range);
}

TEST_F(ProxyTest, DictAccess) {
    ObjectRef original = heap_.NewDict();
    original->Insert(heap_.NewString("a"), heap_.NewInt(1));
    original->Insert(heap_.NewInt(2), heap_.NewString("two"));
    Proxy proxy = batcher_->DeferProxy(original);

    EXPECT_EQ(proxy.Kind(), ObjectKind::kDict);
    EXPECT_EQ(proxy.Lookup("a")->AsInt(), 1);
    EXPECT_EQ(proxy.Lookup(*heap_.NewInt(2))->AsString(), "two");
    EXPECT_THROW(proxy.Lookup("missing"), std::out_of_range);

    proxy.Insert(heap_.NewString("b"), heap_.NewInt(5));
    EXPECT_EQ(proxy.Size(), 3u);
    EXPECT_EQ(original->Size(), 2u);
}

TEST_F(ProxyTest, RecordFields) {
    ObjectRef person = Workload::MakePerson(heap_, "ada", 36, 2);
    Proxy proxy = batcher_->DeferProxy(person);

    EXPECT_EQ(proxy.Kind(), ObjectKind::kRecord);
    EXPECT_EQ(proxy.Field("name")->AsString(), "ada");
    EXPECT_THROW(proxy.Field("salary"), std::out_of_range);

    proxy.SetField("name", heap_.NewString("grace"));
    EXPECT_EQ(proxy.Field("name")->AsString(), "grace");
    EXPECT_EQ(person->GetField("name")->AsString(), "ada");
    EXPECT_NE(proxy.Field("hobbies"), person->GetField("hobbies"));
}

TEST_F(ProxyTest, IteratesListItemsAndDictKeys) {
    Proxy list = batcher_->DeferProxy(heap_.NewList({heap_.NewInt(1), heap_.NewInt(2), heap_.NewInt(3)}));
    int64_t sum = 0;
    for (ObjectRef item : list) {
        sum += item->AsInt();
    }
    EXPECT_EQ(sum, 6);

    ObjectRef dict = heap_.NewDict();
    dict->Insert(heap_.NewString("x"), heap_.NewInt(1));
    dict->Insert(heap_.NewString("y"), heap_.NewInt(2));
    Proxy keys = batcher_->DeferProxy(dict);
    std::vector<std::string> names;
    for (ObjectRef key : keys) {
        names.push_back(key->AsString());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"x", "y"}));

    Proxy scalar = batcher_->DeferProxy(heap_.NewInt(4));
    EXPECT_THROW(scalar.begin(), std::invalid_argument);
}

TEST_F(ProxyTest, TruthinessAndText) {
    Proxy empty = batcher_->DeferProxy(heap_.NewList());
    Proxy full = batcher_->DeferProxy(heap_.NewTuple({heap_.NewInt(1)}));

    EXPECT_FALSE(static_cast<bool>(empty));
    EXPECT_TRUE(static_cast<bool>(full));
    EXPECT_EQ(full.ToString(), "(1,)");
}

TEST_F(ProxyTest, CopiedProxySharesHandle) {
    ObjectRef original = heap_.NewList({heap_.NewInt(1)});
    Proxy proxy = batcher_->DeferProxy(original);
    Proxy alias = proxy;

    EXPECT_EQ(alias.handle(), proxy.handle());
    alias.SetAt(0, heap_.NewInt(5));
    EXPECT_EQ(proxy.At(0)->AsInt(), 5);
    EXPECT_EQ(original->At(0)->AsInt(), 1);
}

TEST_F(ProxyTest, StrictProxyIsMaterializedImmediately) {
    ObjectRef original = heap_.NewList({heap_.NewInt(1)});
    Proxy proxy = batcher_->DeferProxy(original, Consistency::kStrict);
    EXPECT_TRUE(proxy.IsMaterialized());

    original->Append(heap_.NewInt(2));
    EXPECT_EQ(proxy.Size(), 1u);
}

TEST_F(ProxyTest, FailedFlushSurfacesThroughProxy) {
    Proxy good = batcher_->DeferProxy(heap_.NewList());
    Proxy bad = batcher_->DeferProxy(heap_.NewList({heap_.NewResource("socket")}));

    EXPECT_THROW(good.Size(), CopyError);
    EXPECT_FALSE(good.IsMaterialized());
    EXPECT_TRUE(bad.handle()->IsFailed());
    EXPECT_THROW(bad.Resolve(), CopyError);
}

TEST_F(ProxyTest, RejectsMissingBatcherOrHandle) {
    EXPECT_THROW(Proxy(nullptr, std::make_shared<Handle>()), std::invalid_argument);
    EXPECT_THROW(Proxy(batcher_.get(), nullptr), std::invalid_argument);
}
