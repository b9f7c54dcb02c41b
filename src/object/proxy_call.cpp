/***
 * Name: pyhost::object::ProxyObject (calls)
 * Purpose: Positional and keyword calls, call-or-subscript, method calls.
 * Inputs: Arguments already boxed as proxies
 * Outputs: The call result as a received proxy
 * Theory of Operation:
 *   Positional calls go through vectorcall with a stack array of borrowed
 *   handles; the argument proxies keep them alive for the duration of the call.
 *   Method calls use the method vectorcall entry with the receiver as args[0],
 *   so no bound-method object reaches the host. Keyword calls build an args
 *   tuple and a kwargs dict and use the generic call entry.
 */
#include "pyhost/object/ProxyObject.h"

#include <vector>

#include "pyhost/coerce/Containers.h"
#include "pyhost/coerce/ToForeign.h"

namespace pyhost::object {

namespace {

std::vector<ffi::Handle> handlesOf(const ProxyObject::Args& args, std::size_t reserveFront) {
  std::vector<ffi::Handle> handles;
  handles.reserve(args.size() + reserveFront);
  handles.resize(reserveFront, nullptr);
  for (const auto& arg : args) { handles.push_back(arg.handle()); }
  return handles;
}

} // namespace

bool ProxyObject::callable() const { return bridge_->api().callableCheck(handle()) == 1; }

ProxyObject ProxyObject::callWith(const Args& args) const {
  const auto handles = handlesOf(args, 0);
  return bridge_->receive(bridge_->api().vectorcall(handle(), handles.data(), handles.size(), nullptr), "call");
}

ProxyObject ProxyObject::callWith(const Args& args, const Kwargs& kwargs) const {
  if (kwargs.empty()) { return callWith(args); }
  const ProxyObject tuple = coerce::toTuple(*bridge_, args);
  const ProxyObject dict = coerce::toDict(*bridge_, kwargs);
  return bridge_->receive(bridge_->api().call(handle(), tuple.handle(), dict.handle()), "call");
}

ProxyObject ProxyObject::invoke(const Args& args) const {
  if (args.size() == 1 && !callable()) { return getItem(args.front()); }
  return callWith(args);
}

ProxyObject ProxyObject::callMethodWith(const std::string& name, const Args& args) const {
  const ProxyObject methodName = bridge_->box(name);
  auto handles = handlesOf(args, 1);
  handles[0] = handle();
  return bridge_->receive(
      bridge_->api().vectorcallMethod(methodName.handle(), handles.data(), handles.size(), nullptr), "method call");
}

ProxyObject ProxyObject::callMethodWith(const std::string& name, const Args& args, const Kwargs& kwargs) const {
  if (kwargs.empty()) { return callMethodWith(name, args); }
  ProxyObject method = getAttribute(name);
  ProxyObject result = method.callWith(args, kwargs);
  method.close();
  return result;
}

} // namespace pyhost::object
