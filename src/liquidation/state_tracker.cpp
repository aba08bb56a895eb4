#include "liquidation/state_tracker.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

std::string NormalizeBorrower(const std::string& borrower) {
  try {
    return NormalizeAddress(borrower);
  } catch (const std::invalid_argument&) {
    throw ValidationError("invalid borrower address: " + borrower);
  }
}

BorrowerStateTracker::BorrowerStateTracker(const Thresholds& thresholds) : thresholds_(thresholds) {
  thresholds_.Validate();
}

std::shared_ptr<BorrowerStateTracker::Slot> BorrowerStateTracker::SlotFor(const std::string& key) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto& slot = slots_[key];
  if (!slot) slot = std::make_shared<Slot>();
  return slot;
}

std::shared_ptr<BorrowerStateTracker::Slot> BorrowerStateTracker::FindSlot(const std::string& key) const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto it = slots_.find(key);
  return it == slots_.end() ? nullptr : it->second;
}

void BorrowerStateTracker::SetStateLocked(Slot& slot, HealthState state) {
  if (slot.record.health_state != state) {
    slot.record.health_state = state;
    slot.record.state_entered_at = std::chrono::system_clock::now();
  }
}

TransitionResult BorrowerStateTracker::EvaluateLocked(Slot& slot, const std::string& key,
                                                      Amount debt, Amount collateral) {
  auto c = HealthEvaluator::Classify(debt, collateral, thresholds_);
  auto now = std::chrono::system_clock::now();

  TransitionResult r;
  r.borrower = key;
  r.ratio = c.ratio;
  r.debt = debt;
  r.collateral = collateral;
  {
    std::lock_guard<std::mutex> lock(slot.data);
    if (!slot.exists) {
      slot.exists = true;
      slot.record.address = key;
      slot.record.health_state = HealthState::Healthy;
      slot.record.state_entered_at = now;
    }
    r.previous_state = slot.record.health_state;
    slot.record.debt_value = debt;
    slot.record.collateral_value = collateral;
    slot.record.collateral_ratio = c.ratio;
    slot.record.last_evaluated = now;

    std::lock_guard<std::mutex> flight(in_flight_mutex_);
    bool in_flight = in_flight_.count(key) > 0;
    // InAuction is held until the auction settles, Liquidatable until the remediation reports back
    if (r.previous_state == HealthState::InAuction) r.new_state = HealthState::InAuction;
    else if (in_flight) r.new_state = HealthState::Liquidatable;
    else r.new_state = c.state;
    SetStateLocked(slot, r.new_state);
    r.changed = r.new_state != r.previous_state;
    if (r.new_state == HealthState::Liquidatable && !in_flight) {
      in_flight_.insert(key);
      r.remediation_required = true;
    }
  }
  if (r.changed) {
    Logger::Info("Borrower " + key + " " + HealthStateName(r.previous_state) + " -> " +
                 HealthStateName(r.new_state) + ", ratio: " + std::to_string(r.ratio));
  }
  return r;
}

TransitionResult BorrowerStateTracker::Evaluate(const std::string& borrower, Amount debt, Amount collateral) {
  auto key = NormalizeBorrower(borrower);
  auto slot = SlotFor(key);
  std::lock_guard<std::mutex> serial(slot->serial);
  return EvaluateLocked(*slot, key, debt, collateral);
}

TransitionResult BorrowerStateTracker::Refresh(const std::string& borrower, const FetchFn& fetch) {
  auto key = NormalizeBorrower(borrower);
  auto slot = SlotFor(key);
  std::lock_guard<std::mutex> serial(slot->serial);
  auto values = fetch(key);
  return EvaluateLocked(*slot, key, values.first, values.second);
}

TransitionResult BorrowerStateTracker::ApplyRemediationOutcome(const std::string& borrower,
                                                               RemediationOutcome outcome) {
  auto key = NormalizeBorrower(borrower);
  auto slot = SlotFor(key);
  std::lock_guard<std::mutex> serial(slot->serial);
  std::lock_guard<std::mutex> lock(slot->data);
  if (!slot->exists) {
    slot->exists = true;
    slot->record.address = key;
  }
  TransitionResult r;
  r.borrower = key;
  r.previous_state = slot->record.health_state;
  r.debt = slot->record.debt_value;
  r.collateral = slot->record.collateral_value;
  r.ratio = slot->record.collateral_ratio;
  switch (outcome) {
    case RemediationOutcome::Protected: SetStateLocked(*slot, HealthState::Protected); break;
    case RemediationOutcome::InAuction: SetStateLocked(*slot, HealthState::InAuction); break;
    case RemediationOutcome::Liquidated: SetStateLocked(*slot, HealthState::Healthy); break;
    case RemediationOutcome::Failed:
      if (slot->record.health_state != HealthState::InAuction) {
        // values may have moved while the remediation ran
        auto c = HealthEvaluator::Classify(r.debt, r.collateral, thresholds_);
        slot->record.collateral_ratio = c.ratio;
        r.ratio = c.ratio;
        SetStateLocked(*slot, c.state);
      }
      break;
  }
  r.new_state = slot->record.health_state;
  r.changed = r.new_state != r.previous_state;
  std::lock_guard<std::mutex> flight(in_flight_mutex_);
  in_flight_.erase(key);
  return r;
}

void BorrowerStateTracker::EnterAuction(const std::string& borrower) {
  auto key = NormalizeBorrower(borrower);
  auto slot = SlotFor(key);
  std::lock_guard<std::mutex> lock(slot->data);
  if (!slot->exists) {
    slot->exists = true;
    slot->record.address = key;
  }
  SetStateLocked(*slot, HealthState::InAuction);
}

void BorrowerStateTracker::ReleaseAuction(const std::string& borrower) {
  auto key = NormalizeBorrower(borrower);
  auto slot = FindSlot(key);
  if (!slot) return;
  std::lock_guard<std::mutex> lock(slot->data);
  if (!slot->exists || slot->record.health_state != HealthState::InAuction) return;
  auto c = HealthEvaluator::Classify(slot->record.debt_value, slot->record.collateral_value, thresholds_);
  SetStateLocked(*slot, c.state);
  slot->record.collateral_ratio = c.ratio;
  Logger::Info("Borrower " + key + " released from auction as " + HealthStateName(c.state));
}

std::optional<BorrowerRecord> BorrowerStateTracker::Get(const std::string& borrower) const {
  std::string key;
  try {
    key = NormalizeBorrower(borrower);
  } catch (const ValidationError&) {
    return std::nullopt;
  }
  auto slot = FindSlot(key);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lock(slot->data);
  if (!slot->exists) return std::nullopt;
  return slot->record;
}

std::vector<BorrowerRecord> BorrowerStateTracker::Snapshot() const {
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    slots.reserve(slots_.size());
    for (const auto& kv : slots_) slots.push_back(kv.second);
  }
  std::vector<BorrowerRecord> out;
  out.reserve(slots.size());
  for (const auto& s : slots) {
    std::lock_guard<std::mutex> lock(s->data);
    if (s->exists) out.push_back(s->record);
  }
  return out;
}

std::vector<BorrowerRecord> BorrowerStateTracker::AtRisk() const {
  std::vector<BorrowerRecord> out;
  for (auto& r : Snapshot()) {
    if (r.health_state == HealthState::AtRisk) out.push_back(std::move(r));
  }
  return out;
}

std::vector<std::string> BorrowerStateTracker::Pending() const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return std::vector<std::string>(in_flight_.begin(), in_flight_.end());
}

std::vector<std::string> BorrowerStateTracker::KnownBorrowers() const {
  std::vector<std::string> out;
  for (const auto& r : Snapshot()) out.push_back(r.address);
  return out;
}

bool BorrowerStateTracker::IsInFlight(const std::string& borrower) const {
  std::string key;
  try {
    key = NormalizeBorrower(borrower);
  } catch (const ValidationError&) {
    return false;
  }
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.count(key) > 0;
}
