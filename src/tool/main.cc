#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "batcher/batcher.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "object/graph_copier.h"
#include "object/graph_ops.h"
#include "workload/sample_graphs.h"

using namespace DeepBatch;

namespace {

struct Request {
    ObjectRef source;
    HandlePtr handle;
    std::unique_ptr<Proxy> proxy;
};

bool IsMutableKind(ObjectKind kind) {
    return kind == ObjectKind::kList || kind == ObjectKind::kDict || kind == ObjectKind::kRecord;
}

// Checks the copy guarantees for one resolved request. Returns false and logs
// the reason on a violation.
bool VerifyCopy(const Request& request, ObjectRef copy) {
    if (!DeepEquals(request.source, copy)) {
        LOG(ERROR) << "Copy differs from source: " << Repr(request.source).substr(0, 80);
        return false;
    }
    if (IsMutableKind(request.source->kind()) && copy == request.source) {
        LOG(ERROR) << "Copy aliases its source: " << Repr(request.source).substr(0, 80);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("deepbatch_tool", "Batched deep-copy driver");

    options.add_options()
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("n,copies", "Deferred copies per sample graph", cxxopts::value<int>()->default_value("8"))
        ("scale", "Sample graph scale", cxxopts::value<int>()->default_value("1"))
        ("proxy", "Resolve through proxies instead of explicit handles")
        ("alias", "Alias policy: preserve or duplicate", cxxopts::value<std::string>())
        ("consistency", "Consistency mode: at_access or strict", cxxopts::value<std::string>())
        ("max_items", "Auto-flush threshold", cxxopts::value<int>())
        ("l,log_level", "Log level", cxxopts::value<int>())
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    Configuration& configuration = Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << error;
        }
        return 1;
    }

    auto& batcher_config = configuration.config().batcher;
    if (result.count("alias")) batcher_config.alias.set(result["alias"].as<std::string>());
    if (result.count("consistency")) batcher_config.consistency.set(result["consistency"].as<std::string>());
    if (result.count("max_items")) batcher_config.max_items.set(result["max_items"].as<int>());
    FLAGS_v = result.count("log_level") ? result["log_level"].as<int>() : configuration.getLogVerbosity();

    BatcherOptions batcher_options;
    try {
        batcher_options = configuration.toBatcherOptions();
    } catch (const ConfigError& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    int copies = result["copies"].as<int>();
    int scale = result["scale"].as<int>();
    bool use_proxy = result.count("proxy") > 0;

    Heap heap;
    Batcher batcher(std::make_shared<GraphCopier>(heap), batcher_options);

    std::vector<ObjectRef> graphs = Workload::BuildSampleGraphs(heap, scale);
    for (ObjectRef graph : Workload::BuildSharedGraphs(heap, scale)) {
        graphs.push_back(graph);
    }
    ObjectRef cyclic = Workload::BuildCyclicGraph(heap, 4 * scale);
    graphs.push_back(cyclic);

    LOG(INFO) << "Deferring " << copies << " copies of " << graphs.size() << " graphs ("
              << heap.size() << " source objects), alias=" << ToString(batcher_options.alias)
              << " consistency=" << ToString(batcher_options.consistency)
              << " max_items=" << batcher_options.max_items
              << (use_proxy ? " via proxies" : " via handles");

    std::vector<Request> requests;
    try {
        for (ObjectRef graph : graphs) {
            for (int i = 0; i < copies; ++i) {
                Request request;
                request.source = graph;
                if (use_proxy) {
                    request.proxy = std::make_unique<Proxy>(batcher.DeferProxy(graph));
                    request.handle = request.proxy->handle();
                } else {
                    request.handle = batcher.Defer(graph);
                }
                requests.push_back(std::move(request));
            }
        }
        VLOG(1) << batcher.PendingCount() << " entries pending before resolution";

        bool ok = true;
        for (const auto& request : requests) {
            ObjectRef copy = request.proxy ? request.proxy->Resolve() : batcher.Get(request.handle);
            ok &= VerifyCopy(request, copy);
            if (request.source == cyclic && copy->Lookup("self") != copy) {
                LOG(ERROR) << "Cyclic copy lost its self reference";
                ok = false;
            }
        }

        BatcherStats stats = batcher.GetStats();
        LOG(INFO) << "Resolved " << stats.items_resolved << " items in " << stats.flushes << " flushes ("
                  << stats.auto_flushes << " automatic), copy_many=" << stats.copy_many_calls
                  << " copy_one=" << stats.copy_one_calls << " strict=" << stats.strict_copies
                  << " dedup_hits=" << stats.dedup_hits << ", heap now holds " << heap.size() << " objects";
        if (!ok) {
            LOG(ERROR) << "Copy verification failed";
            return 1;
        }
    } catch (const CopyError& e) {
        LOG(ERROR) << "Copy failed: " << e.what();
        return 1;
    }

    LOG(INFO) << "All copies verified";
    return 0;
}
