/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file provisioning.hpp
 * @brief Hand-off of infrastructure events to an external provisioner.
 *
 * The provisioner is fire-and-forget: the lifecycle core never waits for it
 * and never learns whether provisioning succeeded.
 */

#ifndef APL_PROVISIONING_HPP_
#define APL_PROVISIONING_HPP_

#include "apl/events.hpp"
#include "apl/snapshot.hpp"
#include "apl/vocabulary.hpp"

#include <variant>

namespace apl {

struct ProvisioningRequest {
  AppId uuid;
  EventType trigger;  ///< kExistingInfrastructureSelected or kBuildRequested
  InfrastructureTarget target;
};

/// Sink callback. Must not block; queue the work if it is slow.
using ProvisioningSinkFn = void (*)(const ProvisioningRequest& request,
                                    void* context);

/// Request for the infrastructure events, empty for all others.
inline optional<ProvisioningRequest> ToProvisioningRequest(
    const AppDomainEvent& event) {
  if (const auto* sel = std::get_if<ExistingInfrastructureSelected>(&event)) {
    return ProvisioningRequest{sel->uuid, sel->kType, sel->target};
  }
  if (const auto* build = std::get_if<BuildRequested>(&event)) {
    return ProvisioningRequest{build->uuid, build->kType, build->target};
  }
  return {};
}

}  // namespace apl

#endif  // APL_PROVISIONING_HPP_
