// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <typemap/aliases.hpp>
#include <typemap/bundle.hpp>
#include <typemap/type_map.hpp>

using namespace typemap;
using concepts::admits;

namespace {

  struct value {
    std::uint8_t v;

    friend bool operator==(const value&, const value&) = default;
  };

  struct ka {
    using typemap_value = value;
  };

  struct kb {
    using typemap_value = std::string;
  };

  // Must stay on the thread that created it.
  struct thread_bound {
    using thread_affine = void;
    int v;
  };

  // Must not be read from several threads at once.
  struct unsync_counter {
    using unsynchronized = void;
    mutable int reads;
  };

  struct unprintable {
    int v;
  };

  struct move_only {
    std::unique_ptr<int> v;
  };

  struct nested {
    using typemap_value = send_type_map;
  };

} // namespace

// =============================================================================
// Admission
// =============================================================================

// --- Storability ---

static_assert(admits<int, bundles::plain>);
static_assert(!admits<int[3], bundles::plain>);
static_assert(!admits<const int, bundles::plain>);
static_assert(!admits<int&, bundles::plain>);
static_assert(!admits<void, bundles::plain>);

// --- Thread capabilities ---

static_assert(admits<int, bundles::send_sync>);
static_assert(admits<std::string, bundles::send_sync>);
static_assert(admits<std::unique_ptr<int>, bundles::send_sync>);
static_assert(admits<int*, bundles::plain>);
static_assert(!admits<int*, bundles::send>);
static_assert(!admits<int*, bundles::sync>);
static_assert(!admits<thread_bound, bundles::send>);
static_assert(admits<thread_bound, bundles::sync>);
static_assert(admits<unsync_counter, bundles::send>);
static_assert(!admits<unsync_counter, bundles::sync>);

// Wrappers inherit from their element.
static_assert(!admits<std::unique_ptr<thread_bound>, bundles::send>);
static_assert(!admits<std::optional<int*>, bundles::send>);
static_assert(!admits<std::vector<unsync_counter>, bundles::sync>);
static_assert(admits<std::vector<int>, bundles::send_sync>);

// Aggregates need every member to qualify.
static_assert(!admits<std::pair<int*, int>, bundles::send>);
static_assert(!admits<std::tuple<int, thread_bound>, bundles::send>);
static_assert(!admits<std::tuple<unsync_counter>, bundles::sync>);
static_assert(!admits<std::array<int*, 1>, bundles::send>);
static_assert(!admits<std::variant<int, unsync_counter>, bundles::sync>);
static_assert(admits<std::pair<int, std::string>, bundles::send_sync>);
static_assert(admits<std::tuple<int, std::vector<int>>, bundles::send_sync>);
static_assert(admits<std::array<int, 4>, bundles::send_sync>);
static_assert(admits<std::variant<int, std::string>, bundles::send_sync>);

// Non-owning views borrow from another object.
static_assert(!admits<std::reference_wrapper<unsync_counter>, bundles::sync>);
static_assert(!admits<std::reference_wrapper<int>, bundles::send>);
static_assert(!admits<std::span<int>, bundles::send>);
static_assert(!admits<std::span<const int, 3>, bundles::sync>);
static_assert(!admits<std::string_view, bundles::send>);
static_assert(admits<std::string_view, bundles::plain>);

// shared_ptr shares its pointee with the receiving thread.
static_assert(admits<std::shared_ptr<int>, bundles::send_sync>);
static_assert(!admits<std::shared_ptr<unsync_counter>, bundles::send>);
static_assert(!admits<std::shared_ptr<thread_bound>, bundles::sync>);

// --- Cloning & printing ---

static_assert(admits<std::string, bundles::clone>);
static_assert(!admits<std::unique_ptr<int>, bundles::clone>);
static_assert(!admits<move_only, bundles::clone_send_sync>);
static_assert(admits<int*, bundles::clone>);
static_assert(admits<int, bundles::print_send_sync>);
static_assert(!admits<unprintable, bundles::print>);

// --- Containers carry their bundle ---

static_assert(concepts::thread_transferable<send_type_map>);
static_assert(!concepts::thread_transferable<type_map>);
static_assert(concepts::thread_shareable<sync_type_map>);
static_assert(!concepts::thread_shareable<send_type_map>);
static_assert(admits<send_type_map, bundles::send>);
static_assert(!admits<type_map, bundles::send>);
static_assert(!admits<type_map, bundles::clone>);
static_assert(admits<clone_type_map, bundles::clone>);
static_assert(admits<clone_send_sync_type_map, bundles::clone_send_sync>);

// --- Copyability follows the bundle ---

static_assert(!std::is_copy_constructible_v<send_sync_type_map>);
static_assert(std::is_copy_constructible_v<clone_type_map>);
static_assert(std::is_copy_assignable_v<clone_send_sync_type_map>);

TEST_CASE("bundles: Capability sets", "[bundles]")
{
  STATIC_CHECK(bundles::send_sync::thread_transferable);
  STATIC_CHECK(bundles::send_sync::thread_shareable);
  STATIC_CHECK_FALSE(bundles::send_sync::cloneable);
  STATIC_CHECK(bundles::clone_send_sync::capabilities
    == (capability::clone | capability::send | capability::sync));
  STATIC_CHECK(includes(bundles::print_send_sync::capabilities,
    capability::send | capability::sync));
  STATIC_CHECK_FALSE(includes(bundles::plain::capabilities, capability::print));
}

// =============================================================================
// Threads
// =============================================================================

TEST_CASE("bundles: Cross-thread transfer", "[bundles][scenario][thread]")
{
  send_type_map map;
  map.insert<ka>(value{10});
  CHECK(map.contains<ka>());

  auto removed         = std::optional<value>{};
  auto contained_after = true;

  auto worker = std::jthread{[&, m = std::move(map)]() mutable {
    removed         = m.remove<ka>();
    contained_after = m.contains<ka>();
  }};
  worker.join();

  REQUIRE(removed.has_value());
  CHECK(*removed == value{10});
  CHECK_FALSE(contained_after);
}

TEST_CASE("bundles: Concurrent reads", "[bundles][thread]")
{
  sync_type_map map;
  map.insert<kb>("shared");
  map.insert<ka>(value{3});

  const auto& shared  = map;
  auto        matches = std::atomic<int>{0};

  {
    auto readers = std::vector<std::jthread>{};
    for (auto i = 0; i < 4; ++i) {
      readers.emplace_back([&shared, &matches] {
        for (auto n = 0; n < 1000; ++n) {
          if (*shared.get<kb>() == "shared" && *shared.get<ka>() == value{3}) {
            matches.fetch_add(1, std::memory_order_relaxed);
          }
        }
      });
    }
  }

  CHECK(matches.load() == 4000);
}

TEST_CASE("bundles: Containers nest inside containers", "[bundles][thread]")
{
  send_type_map inner;
  inner.insert<kb>("inner");

  send_type_map outer;
  outer.insert<nested>(std::move(inner));

  auto seen   = std::string{};
  auto worker = std::jthread{[&seen, m = std::move(outer)]() mutable {
    if (auto* n = m.get<nested>()) {
      seen = *n->get<kb>();
    }
  }};
  worker.join();

  CHECK(seen == "inner");
}

// =============================================================================
// Cloning
// =============================================================================

TEST_CASE("bundles: Clone faithfulness", "[bundles][scenario][clone]")
{
  clone_type_map original;
  original.insert<ka>(value{10});

  auto copy = original;
  CHECK(*original.get<ka>() == value{10});
  CHECK(*copy.get<ka>() == value{10});
  CHECK(copy.get<ka>() != original.get<ka>());

  SECTION("Mutating the copy")
  {
    copy.get<ka>()->v = 11;
    copy.insert<kb>("copy only");
    CHECK(*original.get<ka>() == value{10});
    CHECK_FALSE(original.contains<kb>());
  }

  SECTION("Mutating the original")
  {
    original.remove<ka>();
    CHECK(*copy.get<ka>() == value{10});
  }

  SECTION("Copy assignment")
  {
    clone_type_map target;
    target.insert<kb>("discarded");

    target = original;
    CHECK(target.size() == 1);
    CHECK_FALSE(target.contains<kb>());
    CHECK(*target.get<ka>() == value{10});
  }
}

TEST_CASE("bundles: Clones cross threads independently",
  "[bundles][clone][thread]")
{
  clone_send_sync_type_map original;
  original.insert<kb>("base");

  auto result = std::string{};
  auto worker = std::jthread{[&result, m = original]() mutable {
    m.get<kb>()->append("-worker");
    result = *m.get<kb>();
  }};
  worker.join();

  CHECK(result == "base-worker");
  CHECK(*original.get<kb>() == "base");
}
