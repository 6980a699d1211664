#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// One accept/reject decision. Resolved at most once, awaited at most once.
class OfferDecision {
public:
  using Handler = std::function<void(bool accepted)>;

  // The handler runs on the thread that resolves the decision, or right away
  // if the decision is already known. Throws std::logic_error on a second wait.
  void async_wait(Handler handler);

  // Returns false, and changes nothing, when already resolved.
  bool resolve(bool accepted);

  std::optional<bool> value() const;

private:
  mutable std::mutex m_;
  std::optional<bool> accepted_;
  Handler handler_;
  bool waited_ = false;
};

struct PendingOffer {
  std::string id;
  std::shared_ptr<OfferDecision> decision;
};

enum class ResolveResult {
  Resolved,
  AlreadyGoneOrUnknown
};

// Offer id -> decision. An entry leaves the table the moment it is resolved,
// so duplicate accept/reject calls (or a timeout racing a user) are no-ops.
class OfferBroker {
public:
  // `max_pending` caps offers awaiting a decision; 0 means no cap.
  explicit OfferBroker(std::size_t max_pending = 0);

  // Empty when the cap is reached.
  std::optional<PendingOffer> create_offer();

  ResolveResult resolve(const std::string& id, bool accepted);

  std::vector<std::string> pending_ids() const;
  std::size_t pending_count() const;
  std::size_t max_pending() const { return max_pending_; }

  // Rejects every pending offer and empties the table.
  void clear();

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, std::shared_ptr<OfferDecision>> offers_;
  std::size_t max_pending_;
};
