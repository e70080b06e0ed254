#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "md/md_types.hpp"

// Shape of a venue frame decoder, checked by WsAgent at compile time:
//  - static kName, kVenue, kUserAgent
//  - constructible from the enabled FeatureSet
//  - subscribe_messages(venue_symbols) const: text frames sent right after connect
//  - parse(frame, received_ms, out): appends zero or more raw events, throws
//    ProtocolError on malformed frames or venue error replies
template <typename T, typename = void>
struct is_frame_parser : std::false_type {};

template <typename T>
struct is_frame_parser<
    T, std::void_t<decltype(T::kVenue), decltype(T::kName), decltype(T::kUserAgent),
                   decltype(std::declval<const T&>().subscribe_messages(std::declval<const std::vector<std::string>&>())),
                   decltype(std::declval<T&>().parse(std::declval<const std::string&>(), std::int64_t{},
                                                     std::declval<std::vector<RawEvent>&>()))>>
    : std::bool_constant<std::is_same_v<std::remove_cv_t<decltype(T::kVenue)>, Venue> &&
                         std::is_convertible_v<decltype(T::kName), const char*> &&
                         std::is_convertible_v<decltype(std::declval<const T&>().subscribe_messages(
                                                   std::declval<const std::vector<std::string>&>())),
                                               std::vector<std::string>> &&
                         std::is_constructible_v<T, FeatureSet>> {};

template <typename T>
inline constexpr bool is_frame_parser_v = is_frame_parser<T>::value;
