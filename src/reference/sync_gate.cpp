#include "cardlink/reference/sync_gate.hpp"

#include <utility>

namespace cardlink::reference {

SyncGate::CardLock::~CardLock() {
  release();
}

SyncGate::CardLock::CardLock(CardLock&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)),
      card_id_(other.card_id_),
      slot_(std::exchange(other.slot_, nullptr)) {}

SyncGate::CardLock& SyncGate::CardLock::operator=(CardLock&& other) noexcept {
  if (this != &other) {
    release();
    gate_ = std::exchange(other.gate_, nullptr);
    card_id_ = other.card_id_;
    slot_ = std::exchange(other.slot_, nullptr);
  }
  return *this;
}

void SyncGate::CardLock::release() {
  if (gate_ == nullptr) {
    return;
  }
  slot_->mutex.unlock();
  gate_->leave(card_id_, slot_);
  gate_ = nullptr;
  slot_ = nullptr;
}

SyncGate::CardLock SyncGate::acquire(core::CardId card_id) {
  Slot* slot = nullptr;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& entry = card_slots_[card_id];
    if (!entry) {
      entry = std::make_unique<Slot>();
    }
    ++entry->users;
    slot = entry.get();
  }
  // The slot stays in the map while its user count is non-zero
  slot->mutex.lock();
  return CardLock(this, card_id, slot);
}

void SyncGate::leave(core::CardId card_id, Slot* slot) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  if (--slot->users == 0) {
    card_slots_.erase(card_id);
  }
}

size_t SyncGate::trackedCards() const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  return card_slots_.size();
}

}  // namespace cardlink::reference
