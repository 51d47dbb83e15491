#pragma once

namespace sunarc {

class DrawPlan;

//  Consumes a finished plan. Rendering is synchronous and cannot fail.
class DrawingSurface {
public:
  virtual ~DrawingSurface() = default;
  virtual void render(const DrawPlan& plan) = 0;
};

}
