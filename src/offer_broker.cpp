#include "offer_broker.hpp"
#include "utils.hpp"

#include <stdexcept>

void OfferDecision::async_wait(Handler handler){
  std::optional<bool> ready;
  {
    std::lock_guard lg(m_);
    if(waited_) throw std::logic_error("offer decision awaited twice");
    waited_ = true;
    if(accepted_){
      ready = accepted_;
    } else {
      handler_ = std::move(handler);
      return;
    }
  }
  if(handler) handler(*ready);
}

bool OfferDecision::resolve(bool accepted){
  Handler handler;
  {
    std::lock_guard lg(m_);
    if(accepted_) return false;
    accepted_ = accepted;
    handler = std::move(handler_);
    handler_ = nullptr;
  }
  if(handler) handler(accepted);
  return true;
}

std::optional<bool> OfferDecision::value() const {
  std::lock_guard lg(m_);
  return accepted_;
}

OfferBroker::OfferBroker(std::size_t max_pending) : max_pending_(max_pending) {}

std::optional<PendingOffer> OfferBroker::create_offer(){
  PendingOffer offer;
  offer.decision = std::make_shared<OfferDecision>();

  std::lock_guard lg(m_);
  if(max_pending_ != 0 && offers_.size() >= max_pending_) return std::nullopt;
  do {
    offer.id = random_hex_id(16);
  } while(offers_.count(offer.id));
  offers_.emplace(offer.id, offer.decision);
  return offer;
}

ResolveResult OfferBroker::resolve(const std::string& id, bool accepted){
  std::shared_ptr<OfferDecision> decision;
  {
    std::lock_guard lg(m_);
    auto it = offers_.find(id);
    if(it == offers_.end()) return ResolveResult::AlreadyGoneOrUnknown;
    decision = std::move(it->second);
    offers_.erase(it);
  }
  // Delivered outside the table lock; the waiter may take other locks.
  if(!decision || !decision->resolve(accepted)) return ResolveResult::AlreadyGoneOrUnknown;
  return ResolveResult::Resolved;
}

std::vector<std::string> OfferBroker::pending_ids() const {
  std::lock_guard lg(m_);
  std::vector<std::string> out;
  out.reserve(offers_.size());
  for(const auto& kv : offers_) out.push_back(kv.first);
  return out;
}

std::size_t OfferBroker::pending_count() const {
  std::lock_guard lg(m_);
  return offers_.size();
}

void OfferBroker::clear(){
  std::unordered_map<std::string, std::shared_ptr<OfferDecision>> dropped;
  {
    std::lock_guard lg(m_);
    dropped.swap(offers_);
  }
  for(auto& kv : dropped){
    if(kv.second) kv.second->resolve(false);
  }
}
