/**
 * @file preset_manager.h
 * @brief Factory patch bank with an editable working copy
 *
 * The bank itself is a static table and is never written. Selecting a
 * patch copies it into the working patch, which callers may then edit
 * before handing it to the engine.
 *
 * @code
 * PresetManager<FmPatch> bank(kFactoryPatches, kNumFactoryPatches);
 * if (bank.SelectByName("bell")) {
 *     bank.Edit().feedback = 0.2f;
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <strings.h>

namespace common {

// PatchT needs a NUL-terminated `name` member
template<typename PatchT>
class PresetManager {
 public:
  PresetManager(const PatchT* bank, uint8_t count)
    : bank_(bank)
    , count_(count)
    , index_(0)
    , edited_(false)
    , working_() {
    if (count_ > 0) {
      working_ = bank_[0];
    }
  }

  /**
   * @brief Copy a factory patch into the working patch
   * @return False if index is past the end of the bank
   */
  bool Select(uint8_t index) {
    if (index >= count_) {
      return false;
    }
    working_ = bank_[index];
    index_ = index;
    edited_ = false;
    return true;
  }

  // Case-insensitive exact match on the patch name
  bool SelectByName(const char* name) {
    if (name == nullptr) {
      return false;
    }
    for (uint8_t i = 0; i < count_; ++i) {
      if (strcasecmp(bank_[i].name, name) == 0) {
        return Select(i);
      }
    }
    return false;
  }

  const char* NameAt(uint8_t index) const {
    return index < count_ ? bank_[index].name : "Invalid";
  }

  const PatchT& PatchAt(uint8_t index) const {
    return bank_[index < count_ ? index : 0];
  }

  uint8_t size() const { return count_; }
  uint8_t index() const { return index_; }

  // True once Edit() was called since the last Select()
  bool edited() const { return edited_; }

  const PatchT& current() const { return working_; }

  PatchT& Edit() {
    edited_ = true;
    return working_;
  }

 private:
  const PatchT* bank_;
  uint8_t count_;
  uint8_t index_;
  bool edited_;
  PatchT working_;
};

}  // namespace common
