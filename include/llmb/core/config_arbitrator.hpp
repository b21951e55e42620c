#pragma once

#include "llmb/core/configs.hpp"
#include "llmb/options.hpp"

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace llmb::core {

// A performance claim that lost against an option already set by a baseline,
// a functional claim or an earlier performance claim.
struct DroppedClaim {
  std::string claim;
  std::string group;
  std::string option;
  config::OptionValue wanted;
  config::OptionValue existing;
  std::string existingSource;
};

class ResolvedConfig {
public:
  const config::OptionStore &store() const noexcept { return store_; }
  config::OptionMap group(const std::string &name) const {
    return store_.values(name);
  }
  std::optional<config::OptionValue> value(const std::string &group,
                                           const std::string &key) const {
    return store_.value(group, key);
  }
  const std::vector<DroppedClaim> &droppedClaims() const noexcept {
    return dropped_;
  }

  bool operator==(const ResolvedConfig &other) const {
    return store_ == other.store_;
  }
  bool operator!=(const ResolvedConfig &other) const {
    return !(*this == other);
  }

private:
  friend class ConfigArbitrator;

  config::OptionStore store_;
  std::vector<DroppedClaim> dropped_;
};

/**
 * @brief Merges baseline options, functional claims and performance claims
 * into one conflict-free configuration.
 *
 * Functional claims must all hold; two of them disagreeing on an option is a
 * ConfigConflictError. Performance claims are applied one at a time on a copy
 * of the working state and are dropped as a whole when any of their options
 * collides, after which their fallback runs once.
 *
 * arbitrate() depends only on the registered inputs and their order, so
 * workers that register the same claims end up with the same result.
 */
class ConfigArbitrator {
public:
  using Fallback = std::function<void()>;
  using ConfigTargets = std::map<std::string, ConfigObject *>;

  // Registers options that hold regardless of features, e.g. restrictions of
  // the device. Throws InconsistentBaselineError when an option already has a
  // different baseline value.
  void setup(const std::string &info, const std::string &group,
             const config::OptionMap &options);

  void claimFunctional(const std::string &feature, const std::string &group,
                       const config::OptionMap &options);

  // Repeated calls with the same name extend the same claim. The first
  // non-empty fallback registered for a claim is the one that runs.
  void claimPerformance(const std::string &perf, const std::string &group,
                        const config::OptionMap &options,
                        Fallback fallback = nullptr);

  ResolvedConfig arbitrate() const;

  // Arbitrates, runs the fallbacks of dropped performance claims and writes
  // the resolved groups into the matching live objects.
  ResolvedConfig resolve(const ConfigTargets &targets);
  ResolvedConfig resolve(std::initializer_list<ConfigObject *> targets);

private:
  struct FunctionalClaim {
    std::string feature;
    config::OptionMap options;
  };

  struct PerformanceClaim {
    std::string name;
    std::vector<std::pair<std::string, config::OptionMap>> entries;
    Fallback fallback;
  };

  config::OptionStore baseline_;
  std::vector<std::string> functionalGroups_;
  std::map<std::string, std::vector<FunctionalClaim>> functionalClaims_;
  std::vector<PerformanceClaim> performanceClaims_;
};

} // namespace llmb::core
