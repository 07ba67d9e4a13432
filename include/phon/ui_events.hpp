#pragma once

#include "errors.hpp"
#include "types.hpp"

namespace phon {

// Events produced for the UI boundary. Default implementations ignore them.
class UiListener {
public:
  virtual ~UiListener() = default;

  virtual void on_item_presented(const PresentedItem& /*item*/) {}
  virtual void on_feedback(const Feedback& /*feedback*/) {}
  virtual void on_level_up(Tier /*new_tier*/) {}
  virtual void on_notice(const Notice& /*notice*/) {}
};

} // namespace phon
