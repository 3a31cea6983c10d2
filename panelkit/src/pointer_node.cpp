// TU header --------------------------------------------
#include "panelkit/pointer_node.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace panelkit {

PointerNode::PointerNode(std::string name, PointerNode* parent)
  : name_(std::move(name)), parent_(parent) {
  if (parent_ != nullptr) {
    parent_->children_.push_back(this);
  }
}

PointerNode::~PointerNode() {
  if (parent_ != nullptr) {
    auto& siblings = parent_->children_;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), this), siblings.end());
  }
  for (PointerNode* child : children_) {
    child->parent_ = nullptr;
  }
}

Vec2 PointerNode::GlobalOrigin() const {
  Vec2 result = origin_;
  for (PointerNode const* node = parent_; node != nullptr; node = node->parent_) {
    result += node->origin_;
  }
  return result;
}

void PointerNode::SetRect(Vec2 const& size) {
  if (!(size.x >= 0.0f && size.y >= 0.0f)) {
    throw std::invalid_argument("PointerNode: negative rect size");
  }
  shape_ = Shape::kRect;
  shape_pos_ = Vec2{};
  rect_size_ = size;
}

void PointerNode::SetCircle(Vec2 const& center, float radius) {
  if (!(radius > 0.0f)) {
    throw std::invalid_argument("PointerNode: radius must be positive");
  }
  shape_ = Shape::kCircle;
  shape_pos_ = center;
  circle_radius_ = radius;
}

bool PointerNode::Contains(Vec2 const& global_point) const {
  Vec2 const local = global_point - this->GlobalOrigin() - shape_pos_;
  switch (shape_) {
  case Shape::kNone:
    return false;
  case Shape::kRect:
    return local.x >= 0.0f && local.y >= 0.0f && local.x < rect_size_.x && local.y < rect_size_.y;
  case Shape::kCircle:
    return local.LengthSquared() <= circle_radius_ * circle_radius_;
  }
  return false;
}

PointerNode* PointerNode::HitTest(Vec2 const& global_point) {
  for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
    if (PointerNode* hit = (*it)->HitTest(global_point)) {
      return hit;
    }
  }
  return this->Contains(global_point) ? this : nullptr;
}

bool PointerNode::IsDescendantOf(PointerNode const* ancestor) const {
  if (ancestor == nullptr) return false;
  for (PointerNode const* node = parent_; node != nullptr; node = node->parent_) {
    if (node == ancestor) return true;
  }
  return false;
}

} // namespace panelkit
