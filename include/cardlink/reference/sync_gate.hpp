#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "cardlink/core/card.hpp"

namespace cardlink::reference {

// Serializes synchronization runs per card inside one process. Runs for
// different cards do not block each other. A card is tracked only while a run
// holds or waits for it.
class SyncGate {
  struct Slot {
    std::mutex mutex;
    size_t users = 0;
  };

 public:
  // Holds one card until destroyed or released
  class CardLock {
   public:
    CardLock() = default;
    ~CardLock();

    CardLock(CardLock&& other) noexcept;
    CardLock& operator=(CardLock&& other) noexcept;
    CardLock(const CardLock&) = delete;
    CardLock& operator=(const CardLock&) = delete;

    bool ownsLock() const noexcept { return gate_ != nullptr; }
    void release();

   private:
    friend class SyncGate;
    CardLock(SyncGate* gate, core::CardId card_id, Slot* slot) noexcept
        : gate_(gate), card_id_(card_id), slot_(slot) {}

    SyncGate* gate_ = nullptr;
    core::CardId card_id_{};
    Slot* slot_ = nullptr;
  };

  SyncGate() = default;

  SyncGate(const SyncGate&) = delete;
  SyncGate& operator=(const SyncGate&) = delete;

  // Blocks until no other run holds the card
  CardLock acquire(core::CardId card_id);

  size_t trackedCards() const;

 private:
  void leave(core::CardId card_id, Slot* slot);

  mutable std::mutex map_mutex_;
  std::unordered_map<core::CardId, std::unique_ptr<Slot>> card_slots_;
};

}  // namespace cardlink::reference
