// odx/model/shape_dumper.hpp - Debug shape-tree output
//
// This header provides utilities for dumping an orchestration's shape tree
// in a human-readable form, used by the `diagnose` command.
//
#pragma once

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "odx/model/orchestration.hpp"

namespace odx
{

// ============================================================================
// ShapeTotals
// ============================================================================

/// Per-kind counts over every shape of a model
struct ShapeTotals
{
  size_t decide = 0;
  size_t switch_count = 0;
  size_t construct = 0;
  size_t message_assignment = 0;
  size_t start = 0;
  size_t receive = 0;
  size_t send = 0;
  size_t scope = 0;
};

[[nodiscard]] inline ShapeTotals count_shapes(const OrchestrationModel & model)
{
  ShapeTotals t;
  for (uint32_t i = 0; i < model.arena.size(); ++i) {
    switch (model.arena.get(ShapeId(i)).kind) {
      case ShapeKind::Decide:
        ++t.decide;
        break;
      case ShapeKind::Switch:
        ++t.switch_count;
        break;
      case ShapeKind::Construct:
        ++t.construct;
        break;
      case ShapeKind::MessageAssignment:
        ++t.message_assignment;
        break;
      case ShapeKind::Start:
        ++t.start;
        break;
      case ShapeKind::Receive:
        ++t.receive;
        break;
      case ShapeKind::Send:
        ++t.send;
        break;
      case ShapeKind::Scope:
        ++t.scope;
        break;
      default:
        break;
    }
  }
  return t;
}

// ============================================================================
// ShapeDumper - Debug shape-tree output
// ============================================================================

/**
 * Dumps a shape tree in an indented format.
 *
 * @code
 *   Orchestration 'Contoso.Billing.ProcessInvoice'
 *   |-[Receive] ReceiveInvoice [Seq:0]
 *   |-[Decide] CheckAmount [Seq:1] expr='msg.Amount > 1000'
 *   | |-TRUE
 *   | | `-[Send] SendApproval [Seq:0]
 *   | `-FALSE
 *   |   `-[Send] SendAuto [Seq:0]
 *   `-[Scope] Tx [Seq:2]
 * @endcode
 *
 * Region lists (Decide branches, Switch cases, Listen branches, Construct
 * inner shapes) are printed as labelled groups below the owning shape.
 */
class ShapeDumper
{
public:
  static constexpr size_t k_max_expression = 60;

  ShapeDumper(std::ostream & os, const OrchestrationModel & model) : os_(os), model_(model) {}

  /// Dump the whole model, header line first
  void dump()
  {
    os_ << "Orchestration '" << model_.full_name() << "'\n";
    std::vector<Item> items;
    for (ShapeId id : model_.shapes) items.push_back(Item::of(id));
    print_items(items);
  }

  /// Dump a single shape and its subtree
  void dump(ShapeId id)
  {
    isLast_ = true;
    visit(id);
  }

  /// Print the per-kind totals block
  void dump_totals()
  {
    const ShapeTotals t = count_shapes(model_);
    os_ << "Totals:\n";
    os_ << "  Decide:            " << t.decide << "\n";
    os_ << "  Switch:            " << t.switch_count << "\n";
    os_ << "  Construct:         " << t.construct << "\n";
    os_ << "  MessageAssignment: " << t.message_assignment << "\n";
    os_ << "  Start:             " << t.start << "\n";
    os_ << "  Receive:           " << t.receive << "\n";
    os_ << "  Send:              " << t.send << "\n";
    os_ << "  Scope:             " << t.scope << "\n";
  }

  /// Expression text capped for one-line display
  [[nodiscard]] static std::string clip(std::string_view text)
  {
    if (text.size() <= k_max_expression) {
      return std::string(text);
    }
    return std::string(text.substr(0, k_max_expression)) + "...";
  }

private:
  // A shape, or a labelled group of shapes
  struct Item
  {
    std::optional<ShapeId> shape;
    std::string label;
    std::vector<ShapeId> group;

    static Item of(ShapeId id)
    {
      Item item;
      item.shape = id;
      return item;
    }

    static Item group_of(std::string label, std::vector<ShapeId> ids)
    {
      Item item;
      item.label = std::move(label);
      item.group = std::move(ids);
      return item;
    }
  };

  std::ostream & os_;
  const OrchestrationModel & model_;
  std::string prefix_;
  bool isLast_ = true;

  void print_items(const std::vector<Item> & items)
  {
    for (size_t i = 0; i < items.size(); ++i) {
      isLast_ = (i == items.size() - 1);
      const Item & item = items[i];
      if (item.shape) {
        visit(*item.shape);
        continue;
      }
      print_prefix();
      os_ << item.label << "\n";
      std::vector<Item> inner;
      for (ShapeId id : item.group) inner.push_back(Item::of(id));
      const IndentScope scope(*this);
      print_items(inner);
    }
  }

  void visit(ShapeId id)
  {
    const Shape & s = model_.shape(id);
    print_prefix();
    os_ << "[" << s.shape_type << "] " << s.name << " [Seq:" << s.sequence << "]";

    std::vector<Item> items;
    if (const auto * d = s.as<DecidePayload>()) {
      if (!d->expression.empty()) os_ << " expr='" << clip(d->expression) << "'";
      items.push_back(Item::group_of("TRUE", d->true_branch));
      items.push_back(Item::group_of("FALSE", d->false_branch));
    } else if (const auto * sw = s.as<SwitchPayload>()) {
      if (!sw->expression.empty()) os_ << " on='" << clip(sw->expression) << "'";
      for (const auto & c : sw->cases) {
        items.push_back(Item::group_of("CASE '" + clip(c.key) + "'", c.shapes));
      }
      if (!sw->default_case.empty()) {
        items.push_back(Item::group_of("DEFAULT", sw->default_case));
      }
    } else if (const auto * l = s.as<ListenPayload>()) {
      for (ShapeId b : l->branches) items.push_back(Item::of(b));
    } else if (const auto * c = s.as<ConstructPayload>()) {
      for (ShapeId inner : c->inner_shapes) items.push_back(Item::of(inner));
    } else if (const auto * r = s.as<ReceivePayload>()) {
      if (r->activate) os_ << " activate";
      if (!r->port_name.empty()) os_ << " port='" << r->port_name << "'";
    }
    os_ << "\n";

    for (ShapeId child : s.children) items.push_back(Item::of(child));
    if (!items.empty()) {
      const IndentScope scope(*this);
      print_items(items);
    }
  }

  void print_prefix()
  {
    os_ << prefix_;
    os_ << (isLast_ ? "`-" : "|-");
  }

  struct IndentScope
  {
    ShapeDumper & d;
    std::string saved;

    explicit IndentScope(ShapeDumper & dumper) : d(dumper), saved(d.prefix_)
    {
      d.prefix_ += d.isLast_ ? "  " : "| ";
    }

    ~IndentScope() { d.prefix_ = saved; }
  };
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(const OrchestrationModel & model, std::ostream & os)
{
  ShapeDumper dumper(os, model);
  dumper.dump();
}

inline std::string dump_to_string(const OrchestrationModel & model)
{
  std::ostringstream ss;
  dump(model, ss);
  return ss.str();
}

}  // namespace odx
