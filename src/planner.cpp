#include "stagecraft/planner.hpp"

#include <functional>
#include <map>
#include <queue>
#include <set>

namespace stagecraft {

namespace {

std::string join_path(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += " -> ";
    out += n;
  }
  return out;
}

}  // namespace

PlanResult plan_build(const Recipe& recipe, const IBaseResolver& resolver,
                      const std::string& target) {
  PlanResult r;
  const auto& stages = recipe.stages;

  std::map<std::string, std::size_t> by_name;
  for (std::size_t i = 0; i < stages.size(); ++i) {
    auto [it, inserted] = by_name.emplace(stages[i].name, i);
    if (!inserted) {
      r.error = make_error(ErrorCode::duplicate_stage,
                           "stage '" + stages[i].name + "' declared at lines " +
                               std::to_string(stages[it->second].line) + " and " +
                               std::to_string(stages[i].line));
      r.error.stage = stages[i].name;
      return r;
    }
  }

  // parent[i] = index of the base stage, or -1 for an external base.
  std::vector<long> parent(stages.size(), -1);
  std::vector<std::vector<std::size_t>> children(stages.size());
  std::vector<int> indegree(stages.size(), 0);
  for (std::size_t i = 0; i < stages.size(); ++i) {
    auto it = by_name.find(stages[i].base);
    if (it != by_name.end()) {
      parent[i] = static_cast<long>(it->second);
      children[it->second].push_back(i);
      indegree[i] = 1;
    } else if (!resolver.contains(stages[i].base)) {
      r.error = make_error(ErrorCode::unknown_base,
                           "base '" + stages[i].base + "' is neither a declared stage nor a known base");
      r.error.stage = stages[i].name;
      return r;
    }
  }

  // Kahn's algorithm; the min-heap keeps declaration order among ready stages.
  std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
  for (std::size_t i = 0; i < stages.size(); ++i) {
    if (indegree[i] == 0) ready.push(i);
  }
  while (!ready.empty()) {
    const std::size_t i = ready.top();
    ready.pop();
    r.order.push_back(i);
    for (std::size_t c : children[i]) {
      if (--indegree[c] == 0) ready.push(c);
    }
  }

  if (r.order.size() != stages.size()) {
    // Each stage has exactly one base, so following base links from any
    // unplaced stage must revisit a stage; the revisited suffix is the cycle.
    std::size_t start = 0;
    while (indegree[start] == 0) ++start;
    std::vector<std::size_t> walk;
    std::map<std::size_t, std::size_t> seen_at;
    std::size_t cur = start;
    while (!seen_at.contains(cur)) {
      seen_at[cur] = walk.size();
      walk.push_back(cur);
      cur = static_cast<std::size_t>(parent[cur]);
    }
    for (std::size_t k = seen_at[cur]; k < walk.size(); ++k) r.cycle.push_back(stages[walk[k]].name);
    r.cycle.push_back(stages[cur].name);
    r.order.clear();
    r.error = make_error(ErrorCode::cyclic_dependency, join_path(r.cycle));
    r.error.stage = stages[cur].name;
    return r;
  }

  if (target.empty()) {
    r.target = stages.size() - 1;
  } else {
    auto it = by_name.find(target);
    if (it == by_name.end()) {
      r.order.clear();
      r.error = make_error(ErrorCode::unknown_target, "no stage named '" + target + "'");
      return r;
    }
    r.target = it->second;
  }
  r.ok = true;
  return r;
}

std::string plan_to_json(const Recipe& recipe, const PlanResult& plan) {
  jsonlite::Object o;
  o["ok"] = plan.ok;
  jsonlite::Array order;
  for (std::size_t i : plan.order) {
    const Stage& s = recipe.stages[i];
    jsonlite::Object st;
    st["name"] = s.name;
    st["base"] = s.base;
    st["instructions"] = static_cast<std::uint64_t>(s.instructions.size());
    order.emplace_back(std::move(st));
  }
  o["order"] = std::move(order);
  if (plan.ok) {
    o["target"] = recipe.stages[plan.target].name;
  } else {
    o["error"] = plan.error.message();
    o["cycle"] = jsonlite::to_array(plan.cycle);
  }
  return jsonlite::to_json(o);
}

}  // namespace stagecraft
