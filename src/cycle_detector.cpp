#include "digen/cycle_detector.hpp"
#include "digen/diagnostic.hpp"
#include "digen/graph.hpp"
#include "digen/log.hpp"

#include <algorithm>
#include <map>

namespace digen {

namespace {

// ------------------------------------------------------------------
// Cycle detection (DFS on the non-collection dependency graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

class cycle_search {
public:
    cycle_search(const dependency_graph& graph, diagnostic_sink& sink)
        : graph_(graph), sink_(sink) {}

    std::vector<cycle> run() {
        for (auto& node : graph_.nodes()) {
            if (!participates(node)) continue;
            if (states_[node.key()] == visit_state::unvisited) {
                dfs(node.key());
            }
        }
        return std::move(found_);
    }

private:
    const dependency_graph& graph_;
    diagnostic_sink& sink_;
    std::map<std::string, visit_state> states_;
    std::vector<std::string> path_;
    std::vector<cycle> found_;

    static bool participates(const type_node& node) {
        return !node.type.external && !node.type.is_interface;
    }

    void dfs(const std::string& key) {
        states_[key] = visit_state::in_progress;
        path_.push_back(key);

        for (const edge* e : graph_.outgoing(key)) {
            if (e->via_collection) continue;
            const type_node* target = graph_.find(e->to);
            if (!target || !participates(*target)) continue;

            auto& state = states_[e->to];
            if (state == visit_state::in_progress) {
                report(e->to);
            } else if (state == visit_state::unvisited) {
                dfs(e->to);
            }
        }

        path_.pop_back();
        states_[key] = visit_state::done;
    }

    void report(const std::string& back_to) {
        // Build cycle path from where the node first appears
        auto it = std::find(path_.begin(), path_.end(), back_to);
        cycle c;
        c.path.assign(it, path_.end());
        c.path.push_back(back_to);

        std::string text;
        std::vector<std::string> names;
        for (std::size_t i = 0; i < c.path.size(); ++i) {
            const auto& name = graph_.find(c.path[i])->type.display_name();
            if (i > 0) text += " -> ";
            text += name;
            if (i + 1 < c.path.size()) names.push_back(name);
        }
        DIGEN_LOG_DEBUG << "Cycle: " << text;
        sink_.report(diagnostic_code::cycle_detected, {text},
                     {.types = std::move(names),
                      .location = graph_.find(back_to)->type.location});
        found_.push_back(std::move(c));
    }
};

} // anonymous namespace

std::vector<cycle> detect_cycles(const dependency_graph& graph, diagnostic_sink& sink) {
    return cycle_search(graph, sink).run();
}

} // namespace digen
