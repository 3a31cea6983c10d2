#pragma once

// c++ headers ------------------------------------------
#include <string>
#include <vector>

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/vec2.h"

namespace panelkit {

/// Node of the containment tree pointer events are targeted at.
/// The origin is relative to the parent; the hit shape is relative to the origin.
class PointerNode final {
public:
  enum class Shape {
    kNone,
    kRect,
    kCircle,
  };

  explicit PointerNode(std::string name, PointerNode* parent = nullptr);
  /// Detaches from the parent and orphans the children.
  ~PointerNode();

  PANELKIT_DISALLOW_COPY_MOVE(PointerNode);

  void SetOrigin(Vec2 const& origin) { origin_ = origin; }
  Vec2 const& origin() const { return origin_; }
  Vec2 GlobalOrigin() const;

  void SetRect(Vec2 const& size);
  /// Circle centered at `center`, in node-local coordinates.
  void SetCircle(Vec2 const& center, float radius);
  void ClearShape() { shape_ = Shape::kNone; }
  Shape shape() const { return shape_; }

  /// Whether the node's own shape contains `global_point`.
  bool Contains(Vec2 const& global_point) const;

  /// Deepest node under `global_point`, later children first; nullptr on a miss.
  /// Children are tested even where they extend past their parent's shape.
  PointerNode* HitTest(Vec2 const& global_point);

  /// Strict: a node is not its own descendant.
  bool IsDescendantOf(PointerNode const* ancestor) const;

  std::string const& name() const { return name_; }
  PointerNode* parent() const { return parent_; }
  std::vector<PointerNode*> const& children() const { return children_; }

private:
  std::string name_;
  PointerNode* parent_ = nullptr;
  std::vector<PointerNode*> children_;

  Vec2 origin_;
  Shape shape_ = Shape::kNone;
  Vec2 shape_pos_;
  Vec2 rect_size_;
  float circle_radius_ = 0.0f;
};

} // namespace panelkit
