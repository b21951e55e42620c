#include "llmb/core/config_arbitrator.hpp"

#include "llmb/core/errors.hpp"
#include "llmb/log.hpp"

#include <algorithm>
#include <iterator>

namespace llmb::core {
namespace {

std::string conflictMessage(const std::string &option,
                            const config::OptionValue &value,
                            const std::string &feature,
                            const config::OptionEntry &existing) {
  return "Cannot set '" + option + "' to be '" + value.describe() +
         "' when enabling '" + feature + "', since '" + existing.source +
         "' has set it to be '" + existing.value.describe() + "'.";
}

void checkAssignable(const ConfigObject &target, const std::string &group,
                     const config::OptionMap &values) {
  const auto &defs = target.definitions();
  for (const auto &[key, value] : values) {
    auto it = std::find_if(defs.begin(), defs.end(),
                           [&](const auto &def) { return def.key == key; });
    if (it == defs.end())
      throw InvalidOptionError("'" + group + "' has no option named '" + key +
                               "'.");
    if (!config::isCompatible(it->kind, value.type(), it->nullable))
      throw InvalidOptionError("Invalid value '" + value.describe() +
                               "' for option '" + key + "' of '" + group +
                               "', expected " + config::kindName(it->kind) +
                               ".");
  }
}

} // namespace

void ConfigArbitrator::setup(const std::string &info, const std::string &group,
                             const config::OptionMap &options) {
  for (const auto &[key, value] : options) {
    if (const auto *existing = baseline_.find(group, key)) {
      if (existing->value != value)
        throw InconsistentBaselineError(
            "Baseline '" + info + "' sets '" + key + "' of '" + group +
            "' to be '" + value.describe() + "', but '" + existing->source +
            "' has set it to be '" + existing->value.describe() + "'.");
    }
    baseline_.set(group, key, value, info, config::OptionLayer::Baseline);
  }
}

void ConfigArbitrator::claimFunctional(const std::string &feature,
                                       const std::string &group,
                                       const config::OptionMap &options) {
  auto it = functionalClaims_.find(group);
  if (it == functionalClaims_.end()) {
    functionalGroups_.push_back(group);
    it = functionalClaims_.emplace(group, std::vector<FunctionalClaim>{})
             .first;
  }
  it->second.push_back({feature, options});
}

void ConfigArbitrator::claimPerformance(const std::string &perf,
                                        const std::string &group,
                                        const config::OptionMap &options,
                                        Fallback fallback) {
  auto it = std::find_if(
      performanceClaims_.begin(), performanceClaims_.end(),
      [&](const PerformanceClaim &claim) { return claim.name == perf; });
  if (it == performanceClaims_.end()) {
    performanceClaims_.push_back({perf, {}, nullptr});
    it = std::prev(performanceClaims_.end());
  }
  it->entries.emplace_back(group, options);
  if (!it->fallback && fallback)
    it->fallback = std::move(fallback);
}

ResolvedConfig ConfigArbitrator::arbitrate() const {
  ResolvedConfig result;
  config::OptionStore working = baseline_;

  for (const auto &group : functionalGroups_) {
    for (const auto &claim : functionalClaims_.at(group)) {
      for (const auto &[option, value] : claim.options) {
        if (const auto *existing = working.find(group, option)) {
          if (existing->value != value)
            throw ConfigConflictError(
                conflictMessage(option, value, claim.feature, *existing),
                group, option, claim.feature, existing->source);
          continue;
        }
        working.set(group, option, value, claim.feature,
                    config::OptionLayer::Functional);
      }
    }
  }

  for (const auto &claim : performanceClaims_) {
    config::OptionStore attempt = working;
    std::optional<DroppedClaim> conflict;

    for (const auto &[group, options] : claim.entries) {
      for (const auto &[option, value] : options) {
        const auto *existing = attempt.find(group, option);
        if (existing && existing->value != value) {
          conflict = DroppedClaim{claim.name,      group,
                                  option,          value,
                                  existing->value, existing->source};
          break;
        }
        attempt.set(group, option, value, claim.name,
                    config::OptionLayer::Performance);
      }
      if (conflict)
        break;
    }

    if (conflict)
      result.dropped_.push_back(std::move(*conflict));
    else
      working = std::move(attempt);
  }

  result.store_ = std::move(working);
  return result;
}

ResolvedConfig ConfigArbitrator::resolve(const ConfigTargets &targets) {
  ResolvedConfig result = arbitrate();

  for (const auto &[group, target] : targets) {
    if (target)
      checkAssignable(*target, group, result.group(group));
  }

  for (const auto &dropped : result.droppedClaims()) {
    log::warning("Ignoring performance claim '" + dropped.claim +
                 "' for option '" + dropped.option + "' due to conflict.");
    auto it = std::find_if(performanceClaims_.begin(),
                           performanceClaims_.end(),
                           [&](const PerformanceClaim &claim) {
                             return claim.name == dropped.claim;
                           });
    if (it != performanceClaims_.end() && it->fallback)
      it->fallback();
  }

  for (const auto &[group, target] : targets) {
    if (!target)
      continue;
    for (const auto &[key, value] : result.group(group))
      target->assign(key, value);
  }
  return result;
}

ResolvedConfig
ConfigArbitrator::resolve(std::initializer_list<ConfigObject *> targets) {
  ConfigTargets named;
  for (auto *target : targets) {
    if (target)
      named[target->groupName()] = target;
  }
  return resolve(named);
}

} // namespace llmb::core
