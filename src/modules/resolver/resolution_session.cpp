// modules/resolver/resolution_session.cpp
#include "modules/resolver/resolution_session.h"
#include "modules/graph/capability_graph.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace dispatchkit {

std::vector<DataId> DispatchResult::missing_outputs() const {
    std::vector<DataId> missing;
    for (const auto& id : requested) {
        if (!solution.contains(id)) {
            missing.push_back(id);
        }
    }
    return missing;
}

ResolutionSession::ResolutionSession(const CapabilityGraph& graph, const Context& inputs,
                                     std::vector<DataId> outputs, ResolverConfig config)
    : graph_(graph),
      inputs_(inputs),
      outputs_(std::move(outputs)),
      config_(config),
      workflow_(std::make_shared<Workflow>(graph.name(), config.record_values)) {}

void ResolutionSession::push_value(const DataId& data, Value value, size_t rank) {
    QueueEntry entry;
    entry.cost = 0.0;
    entry.rank = rank;
    entry.seq = next_seq_++;
    entry.data = data;
    entry.value = std::move(value);
    queue_.push(std::move(entry));
}

void ResolutionSession::seed() {
    push_value(START, nullptr, 0);

    for (auto it = inputs_.begin(); it != inputs_.end(); ++it) {
        const std::string& key = it.key();
        if (key == START || key == SINK) continue;
        if (!graph_.contains(key) || !graph_.node(key).is_data()) {
            spdlog::debug("[{}] ignoring input '{}': not a data node", graph_.name(), key);
            continue;
        }
        push_value(key, it.value(), 0);
    }

    for (const auto* data : graph_.data_nodes()) {
        if (!data->default_value.has_value() || inputs_.contains(data->id)) continue;
        if (graph_.producers(data->id).empty() && !data->wait_inputs) {
            push_value(data->id, *data->default_value, 1);
        } else {
            fallback_defaults_.push_back(data->id);
        }
    }
}

bool ResolutionSession::push_fallback_defaults() {
    bool pushed = false;
    for (const auto& id : fallback_defaults_) {
        if (settled_.count(id)) continue;
        spdlog::debug("[{}] falling back to default of '{}'", graph_.name(), id);
        push_value(id, *graph_.data_node(id).default_value, 1);
        pushed = true;
    }
    fallback_defaults_.clear();
    return pushed;
}

// A sub-dispatcher still waiting on inputs that never settled runs with the ones that did
bool ResolutionSession::release_deferred() {
    bool pushed = false;
    for (const auto* fn : deferred_) {
        auto& state = functions_[fn->id];
        if (!state.deferred || state.discarded) continue;
        state.deferred = false;
        state.released = true;
        state.cost = std::max(input_cost(fn), frontier_);
        spdlog::debug("[{}] releasing '{}' without its unsettled inputs", graph_.name(), fn->id);
        push_outputs(fn, state);
        pushed = true;
    }
    deferred_.clear();
    return pushed;
}

bool ResolutionSession::requested_settled() const {
    return std::all_of(outputs_.begin(), outputs_.end(),
                       [&](const DataId& id) { return settled_.count(id) > 0; });
}

DispatchResult ResolutionSession::run() {
    seed();

    bool done = false;
    while (!done) {
        while (!queue_.empty()) {
            QueueEntry entry = queue_.top();
            queue_.pop();
            frontier_ = std::max(frontier_, entry.cost);
            settle(entry);
            if (config_.stop_on_outputs && !outputs_.empty() && requested_settled()) {
                done = true;
                break;
            }
        }
        if (!done && !push_fallback_defaults() && !release_deferred()) {
            done = true;
        }
    }

    DispatchResult result;
    for (const auto& id : settle_order_) {
        if (id == START) continue;
        result.solution[id] = settled_.at(id).value;
    }
    result.workflow = workflow_;
    result.requested = outputs_;
    return result;
}

void ResolutionSession::settle(const QueueEntry& entry) {
    if (settled_.count(entry.data)) {
        return;
    }

    Settlement settlement;
    settlement.cost = entry.cost;
    if (entry.producer) {
        auto& state = functions_[entry.producer->id];
        if (state.discarded) return;
        if (!state.invoked && (!ready_to_invoke(entry, state) || !invoke(entry.producer, state))) return;
        auto it = state.result->outputs.find(entry.data);
        if (it == state.result->outputs.end()) {
            spdlog::debug("[{}] '{}' did not produce '{}'", graph_.name(), entry.producer->id, entry.data);
            return;
        }
        settlement.value = *it;
        settlement.via = entry.producer->id;
    } else {
        settlement.value = entry.value;
        settlement.via = START;
    }

    if (entry.data != START) {
        workflow_->record_settlement(entry.data, settlement.value, settlement.via, settlement.cost);
        spdlog::debug("[{}] settled '{}' via '{}' at cost {}", graph_.name(), entry.data, settlement.via,
                      settlement.cost);
    }
    settled_.emplace(entry.data, std::move(settlement));
    settle_order_.push_back(entry.data);

    for (const auto* fn : graph_.consumers(entry.data)) {
        if (entry.data == START || fn->triggered_by(entry.data)) {
            on_input_settled(fn, entry.data);
        }
    }
}

void ResolutionSession::on_input_settled(const FunctionNode* fn, const DataId& data) {
    auto& state = functions_[fn->id];
    if (state.discarded) return;
    if (state.triggered) {
        if (state.deferred && !has_unsettled_inputs(fn)) {
            state.deferred = false;
            state.cost = input_cost(fn);
            push_outputs(fn, state);
        }
        return;
    }

    if (fn->waits_all_inputs()) {
        if (!state.counted) {
            std::vector<DataId> distinct;
            for (const auto& input : fn->inputs) {
                if (std::find(distinct.begin(), distinct.end(), input) == distinct.end()) {
                    distinct.push_back(input);
                }
            }
            state.pending = distinct.size();
            state.counted = true;
        }
        if (data != START) {
            --state.pending;
        }
        if (state.pending > 0) return;
    }
    trigger(fn, state);
}

bool ResolutionSession::eligible(const FunctionNode* fn) const {
    if (!fn->input_domain) return true;
    try {
        return fn->input_domain(inputs_);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] input domain of '{}' failed: {}", graph_.name(), fn->id, e.what());
        return false;
    } catch (...) {
        spdlog::warn("[{}] input domain of '{}' failed: unknown error", graph_.name(), fn->id);
        return false;
    }
}

void ResolutionSession::trigger(const FunctionNode* fn, FunctionState& state) {
    state.triggered = true;
    if (!eligible(fn)) {
        state.discarded = true;
        spdlog::debug("[{}] '{}' is outside its input domain", graph_.name(), fn->id);
        return;
    }

    state.cost = input_cost(fn);
    push_outputs(fn, state);
}

void ResolutionSession::push_outputs(const FunctionNode* fn, const FunctionState& state) {
    for (const auto& output : fn->outputs) {
        if (output == SINK || settled_.count(output)) continue;
        QueueEntry entry;
        entry.cost = state.cost;
        entry.rank = 2 + fn->order;
        entry.seq = next_seq_++;
        entry.data = output;
        entry.producer = fn;
        queue_.push(std::move(entry));
    }
}

double ResolutionSession::input_cost(const FunctionNode* fn) const {
    double max_cost = 0.0;
    for (const auto& input : fn->inputs) {
        auto it = settled_.find(input);
        if (it != settled_.end()) {
            max_cost = std::max(max_cost, it->second.cost);
        }
    }
    return fn->weight + max_cost;
}

bool ResolutionSession::has_unsettled_inputs(const FunctionNode* fn) const {
    return std::any_of(fn->inputs.begin(), fn->inputs.end(), [&](const DataId& input) {
        return fn->triggered_by(input) && settled_.count(input) == 0;
    });
}

// Sub-dispatchers trigger on their first mapped input. Before the child runs, every other
// mapped input must be settled (or the queue drained) and the entry must carry their cost.
bool ResolutionSession::ready_to_invoke(const QueueEntry& entry, FunctionState& state) {
    const FunctionNode* fn = entry.producer;
    if (fn->waits_all_inputs() || state.released) return true;

    if (has_unsettled_inputs(fn)) {
        if (!state.deferred) {
            state.deferred = true;
            deferred_.push_back(fn);
            spdlog::debug("[{}] deferring '{}' until its mapped inputs settle", graph_.name(), fn->id);
        }
        return false;
    }
    if (state.deferred) return false;

    double cost = input_cost(fn);
    if (cost > entry.cost) {
        state.cost = cost;
        QueueEntry again = entry;
        again.cost = cost;
        again.seq = next_seq_++;
        queue_.push(std::move(again));
        return false;
    }
    return true;
}

Context ResolutionSession::settled_arguments(const FunctionNode* fn) const {
    Context arguments = Context::object();
    for (const auto& input : fn->inputs) {
        auto it = settled_.find(input);
        if (it != settled_.end()) {
            arguments[input] = it->second.value;
        }
    }
    return arguments;
}

bool ResolutionSession::invoke(const FunctionNode* fn, FunctionState& state) {
    state.invoked = true;
    // Sub-dispatchers see every mapped input settled up to now, not only those at trigger time
    Context arguments = settled_arguments(fn);
    InvocationScope scope{inputs_, config_.record_values};

    spdlog::debug("[{}] invoking '{}'", graph_.name(), fn->id);
    try {
        state.result = fn->invoke(arguments, scope);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] function '{}' failed: {}", graph_.name(), fn->id, e.what());
        state.discarded = true;
        workflow_->record_failure(fn->id, e.what());
        return false;
    } catch (...) {
        spdlog::warn("[{}] function '{}' failed: unknown error", graph_.name(), fn->id);
        state.discarded = true;
        workflow_->record_failure(fn->id, "unknown error");
        return false;
    }

    workflow_->record_invocation(fn->id, arguments, state.result->outputs, state.result->sub_workflow);
    auto sink = state.result->outputs.find(SINK);
    if (sink != state.result->outputs.end()) {
        workflow_->record_settlement(SINK, *sink, fn->id, state.cost);
    }
    return true;
}

} // namespace dispatchkit
