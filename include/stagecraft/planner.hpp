#pragma once

// stagecraft/planner.hpp - Build graph planning.
//
// ORDERING CONTRACT:
//   The plan is a topological order over every declared stage in which each
//   stage follows its base stage. Among stages that are ready at the same
//   time, the one declared first goes first. Two runs over the same recipe
//   always produce the same plan.
//
// A base reference names a stage when it equals a declared stage name
// (regardless of where that stage is declared); otherwise it must be known
// to the base resolver.

#include <string>
#include <vector>

#include "stagecraft/base_registry.hpp"
#include "stagecraft/recipe.hpp"
#include "stagecraft/types.hpp"

namespace stagecraft {

struct PlanResult {
  bool ok{false};
  BuildError error;
  std::vector<std::size_t> order;  // indices into Recipe::stages
  std::size_t target{0};
  std::vector<std::string> cycle;  // stage names, first == last, on cyclic_dependency
};

// target: stage name, or "" for the last declared stage.
PlanResult plan_build(const Recipe& recipe, const IBaseResolver& resolver,
                      const std::string& target = "");

std::string plan_to_json(const Recipe& recipe, const PlanResult& plan);

}  // namespace stagecraft
