#pragma once
#include "liquidation/health_evaluator.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct BorrowerRecord {
  std::string address;
  Amount debt_value = 0;
  Amount collateral_value = 0;
  double collateral_ratio = 0;
  HealthState health_state = HealthState::Healthy;
  std::chrono::system_clock::time_point last_evaluated;
  std::chrono::system_clock::time_point state_entered_at;
};

struct TransitionResult {
  std::string borrower;
  HealthState previous_state = HealthState::Healthy;
  HealthState new_state = HealthState::Healthy;
  double ratio = 0;
  Amount debt = 0;
  Amount collateral = 0;
  bool changed = false;
  // Set at most once per remediation: the borrower was just added to the in-flight set.
  bool remediation_required = false;
};

enum class RemediationOutcome { Protected, InAuction, Liquidated, Failed };

// Authoritative borrower map. Updates for one borrower are serialized; the
// in-flight set guarantees a single remediation per borrower at a time, and
// an in-flight borrower reports Liquidatable until its outcome is applied.
class BorrowerStateTracker {
public:
  // Returns (debt, collateral) for the borrower.
  using FetchFn = std::function<std::pair<Amount, Amount>(const std::string&)>;

  explicit BorrowerStateTracker(const Thresholds& thresholds);

  // Throws ValidationError for a malformed address or amounts; state is untouched then.
  TransitionResult Evaluate(const std::string& borrower, Amount debt, Amount collateral);
  // Holds the borrower's lock across fetch and update so a slow read cannot
  // overwrite a newer one. Exceptions from fetch propagate unchanged.
  TransitionResult Refresh(const std::string& borrower, const FetchFn& fetch);

  // Sets the resulting state and clears the in-flight flag. A failed
  // remediation reclassifies from the latest values; remediation_required is
  // never set on the result.
  TransitionResult ApplyRemediationOutcome(const std::string& borrower, RemediationOutcome outcome);
  // Puts a borrower into InAuction for an auction observed on chain.
  void EnterAuction(const std::string& borrower);
  // Leaves InAuction and reclassifies from the last known values.
  void ReleaseAuction(const std::string& borrower);

  std::optional<BorrowerRecord> Get(const std::string& borrower) const;
  std::vector<BorrowerRecord> Snapshot() const;
  std::vector<BorrowerRecord> AtRisk() const;
  std::vector<std::string> Pending() const;
  std::vector<std::string> KnownBorrowers() const;
  bool IsInFlight(const std::string& borrower) const;
  const Thresholds& GetThresholds() const { return thresholds_; }

private:
  struct Slot {
    std::mutex serial; // held across fetch + update
    mutable std::mutex data;
    BorrowerRecord record;
    bool exists = false;
  };

  std::shared_ptr<Slot> SlotFor(const std::string& key);
  std::shared_ptr<Slot> FindSlot(const std::string& key) const;
  TransitionResult EvaluateLocked(Slot& slot, const std::string& key, Amount debt, Amount collateral);
  void SetStateLocked(Slot& slot, HealthState state);

  Thresholds thresholds_;
  mutable std::mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
  mutable std::mutex in_flight_mutex_;
  std::set<std::string> in_flight_;
};

// Lowercase 0x address. Throws ValidationError.
std::string NormalizeBorrower(const std::string& borrower);
