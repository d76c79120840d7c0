#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <outcome.hpp>

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#define TRY(...) OUTCOME_TRY(__VA_ARGS__)
#define TRYV(...) OUTCOME_TRYV(__VA_ARGS__)

#if defined(__GNUC__) || defined(__clang__)
#define TRYX(...) OUTCOME_TRYX(__VA_ARGS__)
#endif

namespace outcome = OUTCOME_V2_NAMESPACE::experimental;

namespace chunkspan {

template <typename R,
          typename S = outcome::erased_errored_status_code<
              typename outcome::system_code::value_type>,
          typename NoValuePolicy =
              outcome::policy::default_status_result_policy<R, S>>
using Result = outcome::status_result<R, S, NoValuePolicy>;

enum class ChunkErrc : uint8_t {
  invalid_argument = 1,
  io_error,
  open_failed,
  seek_failed,
  read_failed,
  unclaimed_work,
  truncated_frame,
};

/// Context carried by every ChunkErrc failure. `file_id` and `offset` are
/// left empty when the failing operation is not tied to a file position.
struct ErrorInfo {
  std::string file_id;
  std::optional<uint64_t> offset;
  std::string detail;
};

}  // namespace chunkspan

template <>
struct fmt::formatter<SYSTEM_ERROR2_NAMESPACE::status_code_domain::string_ref>
    : fmt::formatter<std::string_view> {
  using T = SYSTEM_ERROR2_NAMESPACE::status_code_domain::string_ref;
  template <typename FormatContext>
  auto format(const T &s, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        std::string_view{s.data(), s.size()}, ctx);
  }
};

template <typename T>
  requires outcome::is_status_code<T>::value ||
           outcome::is_errored_status_code<T>::value
struct fmt::formatter<T> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const T &c, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "ErrorDomain={} {}", c.domain().name(),
                          c.message());
  }
};

template <>
struct fmt::formatter<std::source_location> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const std::source_location &location, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    std::string_view v{location.file_name()};
    return fmt::format_to(ctx.out(), "{}:{}", v.substr(v.find_last_of('/') + 1),
                          location.line());
  }
};

template <>
struct fmt::formatter<chunkspan::ErrorInfo> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const chunkspan::ErrorInfo &info, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    auto out = ctx.out();
    if (!info.file_id.empty()) {
      out = fmt::format_to(out, "file=`{}` ", info.file_id);
    }
    if (info.offset) {
      out = fmt::format_to(out, "offset={} ", *info.offset);
    }
    return fmt::format_to(out, "{}", info.detail);
  }
};

SYSTEM_ERROR2_NAMESPACE_BEGIN

namespace detail {
inline status_code_domain::string_ref to_string_ref(const std::string &s) {
  auto p = static_cast<char *>(malloc(s.size() + 1));  // NOLINT
  std::memcpy(p, s.data(), s.size());                  // NOLINT
  p[s.size()] = '\0';                                  // NOLINT
  return status_code_domain::atomic_refcounted_string_ref{p, s.size()};
}
}  // namespace detail

template <typename Enum, typename Payload>
concept EnumPayload = std::is_enum_v<Enum> &&
                      requires {
                        { quick_status_code_from_enum<Enum>::payload_uuid };
                        {
                          quick_status_code_from_enum<Enum>::all_failures
                        } -> std::convertible_to<bool>;
                      } && fmt::is_formattable<Payload>::value &&
                      std::is_nothrow_move_constructible_v<Payload>;

template <typename Enum, typename Payload>
struct EnumPayloadDomainImpl;

template <typename Enum, typename Payload>
using EnumPayloadError = status_code<EnumPayloadDomainImpl<Enum, Payload>>;

/// Status code domain for an enum registered with
/// quick_status_code_from_enum, extended with a formattable payload and the
/// location that raised the error. Compares equivalent to the bare enum and
/// to the generic codes listed in the enum's mapping.
template <typename Enum, typename Payload>
struct EnumPayloadDomainImpl final : public status_code_domain {
  using Base = status_code_domain;
  using QuickEnum = quick_status_code_from_enum<Enum>;
  using Mapping = typename QuickEnum::mapping;
  using Self = EnumPayloadError<Enum, Payload>;

  struct value_type {
    Enum value{};
    Payload payload{};
    std::source_location loc = std::source_location::current();
  };

  static constexpr size_t uuid_size = detail::cstrlen(QuickEnum::payload_uuid);
  static constexpr uint64_t payload_uuid =
      detail::parse_uuid_from_pointer<uuid_size>(QuickEnum::payload_uuid);

  constexpr EnumPayloadDomainImpl() : Base(payload_uuid) {}
  EnumPayloadDomainImpl(const EnumPayloadDomainImpl &) = default;
  EnumPayloadDomainImpl(EnumPayloadDomainImpl &&) = default;
  EnumPayloadDomainImpl &operator=(const EnumPayloadDomainImpl &) = default;
  EnumPayloadDomainImpl &operator=(EnumPayloadDomainImpl &&) = default;
  ~EnumPayloadDomainImpl() = default;

  static constexpr const EnumPayloadDomainImpl &get();

  static const Mapping *find_mapping(Enum v) {
    for (const auto &m : QuickEnum::value_mappings()) {
      if (m.value == v) {
        return &m;
      }
    }
    return nullptr;
  }

  string_ref name() const noexcept final {
    return string_ref{QuickEnum::domain_name};
  }

  payload_info_t payload_info() const noexcept final {
    return {sizeof(value_type),
            sizeof(status_code_domain *) + sizeof(value_type),
            (alignof(value_type) > alignof(status_code_domain *))
                ? alignof(value_type)
                : alignof(status_code_domain *)};
  }

  bool _do_failure(const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    if constexpr (QuickEnum::all_failures) {
      return true;
    } else {
      const auto &c = static_cast<const Self &>(code);  // NOLINT
      const auto *m = find_mapping(c.value().value);
      assert(m != nullptr);
      for (auto ec : m->code_mappings) {
        if (ec == errc::success) {
          return false;
        }
      }
      return true;
    }
  }

  bool _do_equivalent(const status_code<void> &code1,
                      const status_code<void> &code2) const noexcept final {
    assert(code1.domain() == *this);
    const auto &c1 = static_cast<const Self &>(code1);  // NOLINT
    if (code2.domain() == *this) {
      const auto &c2 = static_cast<const Self &>(code2);  // NOLINT
      return c1.value().value == c2.value().value;
    }

    // nested copies live behind an indirecting domain whose id is ours
    // xor'd with the nesting constant
    if (code1.domain().id() == (code2.domain().id() ^ 0xc44f7bdeb2cc50e9)) {
      using IndirectCode = status_code<
          detail::indirecting_domain<Self, std::allocator<Self>>>;
      const auto &c2 = static_cast<const IndirectCode &>(code2);  // NOLINT
      return c1.value().value == c2.value()->sc.value().value;
    }

    if (code2.domain() == quick_status_code_from_enum_domain<Enum>) {
      using QuickCode = quick_status_code_from_enum_code<Enum>;
      const auto &c2 = static_cast<const QuickCode &>(code2);  // NOLINT
      return c1.value().value == c2.value();
    }

    if (code2.domain() == generic_code_domain) {
      const auto &c2 = static_cast<const generic_code &>(code2);  // NOLINT
      const auto *m = find_mapping(c1.value().value);
      assert(m != nullptr);
      for (auto ec : m->code_mappings) {
        if (ec == c2.value()) {
          return true;
        }
      }
    }
    return false;
  }

  generic_code _generic_code(
      const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    const auto &c = static_cast<const Self &>(code);  // NOLINT
    const auto *m = find_mapping(c.value().value);
    assert(m != nullptr);
    if (m->code_mappings.size() > 0) {
      return *m->code_mappings.begin();
    }
    return errc::unknown;
  }

  string_ref _do_message(const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    const auto &v = static_cast<const Self &>(code).value();  // NOLINT
    const auto *m = find_mapping(v.value);
    assert(m != nullptr);
    return detail::to_string_ref(
        fmt::format("{} {} {}", v.loc, m->message, v.payload));
  }

  void _do_throw_exception(const status_code<void> &code) const final {
    assert(code.domain() == *this);
    const auto &c = static_cast<const Self &>(code);  // NOLINT
    throw status_error<EnumPayloadDomainImpl>(c);
  }
};

template <typename Enum, typename Payload>
constexpr EnumPayloadDomainImpl<Enum, Payload> EnumPayloadDomain = {};

template <typename Enum, typename Payload>
constexpr const EnumPayloadDomainImpl<Enum, Payload> &
EnumPayloadDomainImpl<Enum, Payload>::get() {
  return EnumPayloadDomain<Enum, Payload>;
}

template <typename Enum, typename Payload>
inline system_code make_status_code(EnumPayloadError<Enum, Payload> e) {
  return make_nested_status_code(std::move(e));
}

template <typename Enum, typename Payload>
  requires EnumPayload<Enum, std::remove_cvref_t<Payload>>
EnumPayloadError<Enum, std::remove_cvref_t<Payload>> make_error(
    Enum e, Payload &&payload,
    std::source_location loc = std::source_location::current()) {
  return EnumPayloadError<Enum, std::remove_cvref_t<Payload>>(
      {e, std::forward<Payload>(payload), loc});
}

template <>
struct quick_status_code_from_enum<chunkspan::ChunkErrc>
    : quick_status_code_from_enum_defaults<chunkspan::ChunkErrc> {
  static constexpr auto domain_name = "chunkspan::ChunkErrc";
  static constexpr auto domain_uuid = "d6ea0352-47b6-45c0-9651-15592c7524c3";
  static constexpr auto payload_uuid = "a804cd2e-929d-4df2-b34b-7047a9cd86ba";
  static constexpr bool all_failures = true;
  static const std::initializer_list<mapping> &value_mappings() {
    // NOLINTBEGIN
    // clang-format off
    static const std::initializer_list<mapping> v = {
        {chunkspan::ChunkErrc::invalid_argument, "invalid_argument", {errc::invalid_argument}},
        {chunkspan::ChunkErrc::io_error, "io_error", {errc::io_error}},
        {chunkspan::ChunkErrc::open_failed, "open_failed", {errc::io_error}},
        {chunkspan::ChunkErrc::seek_failed, "seek_failed", {errc::io_error, errc::invalid_seek}},
        {chunkspan::ChunkErrc::read_failed, "read_failed", {errc::io_error}},
        {chunkspan::ChunkErrc::unclaimed_work, "unclaimed_work", {}},
        {chunkspan::ChunkErrc::truncated_frame, "truncated_frame", {errc::bad_message}},
    };
    // clang-format on
    // NOLINTEND
    return v;
  }
};

SYSTEM_ERROR2_NAMESPACE_END

namespace chunkspan {

using SYSTEM_ERROR2_NAMESPACE::make_error;

/// Shorthand for the common failure shape: an enum, the file it concerns and
/// optionally where in the file it happened.
inline auto make_file_error(
    ChunkErrc e, std::string file_id, std::optional<uint64_t> offset,
    std::string detail,
    std::source_location loc = std::source_location::current()) {
  return make_error(e,
                    ErrorInfo{
                        .file_id = std::move(file_id),
                        .offset = offset,
                        .detail = std::move(detail),
                    },
                    loc);
}

inline std::string errno_message(int e) {
  return std::strerror(e);
}

}  // namespace chunkspan
