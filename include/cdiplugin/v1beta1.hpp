// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __CDIPLUGIN_V1BETA1_HPP__
#define __CDIPLUGIN_V1BETA1_HPP__

#include <ostream>
#include <string>
#include <type_traits>

// Generated from `v1beta1/api.proto` at build time.
#include <cdiplugin/v1beta1/api.pb.h>
#include <cdiplugin/v1beta1/api.grpc.pb.h>

#include <google/protobuf/message.h>

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <stout/check.hpp>

namespace cdiplugin {
namespace v1beta1 {

using namespace ::v1beta1;

constexpr char API_VERSION[] = "v1beta1";

// Name of the kubelet's registration socket inside the device plugin
// directory.
constexpr char KUBELET_SOCKET[] = "kubelet.sock";

// Values of `Device.health`.
constexpr char HEALTHY[] = "Healthy";
constexpr char UNHEALTHY[] = "Unhealthy";

} // namespace v1beta1 {
} // namespace cdiplugin {


namespace v1beta1 {

// Lets tests compare kubelet API messages with `EXPECT_EQ`. A dedicated
// overload for a single message type still wins over these templates.
template <
    typename Message,
    typename std::enable_if<std::is_convertible<
        Message*, google::protobuf::Message*>::value, int>::type = 0>
bool operator==(const Message& left, const Message& right)
{
  // proto3 cannot tell an unset field from a default one, so two
  // messages that differ only in that way compare equal.
  return google::protobuf::util::MessageDifferencer::Equivalent(left, right);
}


template <
    typename Message,
    typename std::enable_if<std::is_convertible<
        Message*, google::protobuf::Message*>::value, int>::type = 0>
bool operator!=(const Message& left, const Message& right)
{
  return !(left == right);
}


// Prints kubelet API messages as JSON, which is also how the plugin logs
// registration requests and allocation responses.
template <
    typename Message,
    typename std::enable_if<std::is_convertible<
        Message*, google::protobuf::Message*>::value, int>::type = 0>
std::ostream& operator<<(std::ostream& stream, const Message& message)
{
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(message, &json);

  CHECK(status.ok())
    << "Failed to print " << message.GetTypeName() << ": " << status.ToString();

  return stream << json;
}

} // namespace v1beta1 {

#endif // __CDIPLUGIN_V1BETA1_HPP__
