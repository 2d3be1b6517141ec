#include <syncoro/syncoro.hpp>

#include <iocoro/iocoro.hpp>

#include <cstddef>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// A synchronous, single-threaded key/value store: every call must come from the thread that
// opened it.
class kv_store {
 public:
  explicit kv_store(std::string name) : name_(std::move(name)), owner_(std::this_thread::get_id()) {}

  auto put(std::string const& key, std::string value) -> void {
    check_thread();
    data_[key] = std::move(value);
  }

  [[nodiscard]] auto get(std::string const& key) const -> std::string {
    check_thread();
    auto it = data_.find(key);
    if (it == data_.end()) {
      throw std::out_of_range("no such key: " + key);
    }
    return it->second;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    check_thread();
    return data_.size();
  }

  auto flush() -> void {
    check_thread();
    std::cout << "[" << name_ << "] flushed " << data_.size() << " keys\n";
  }

 private:
  auto check_thread() const -> void {
    if (std::this_thread::get_id() != owner_) {
      throw std::logic_error("kv_store used from a foreign thread");
    }
  }

  std::string name_;
  std::thread::id owner_;
  std::map<std::string, std::string> data_;
};

struct trace_printer {
  static auto on_finish(void*, syncoro::operation_trace_finish const& ev) -> void {
    std::cout << "[trace] #" << ev.info.id << " kind=" << syncoro::to_string(ev.info.kind)
              << " queued_ns=" << ev.queued.count() << " duration_ns=" << ev.duration.count();
    if (!ev.ok) {
      std::cout << " error=" << ev.error.message() << " detail=" << ev.error_detail;
    }
    std::cout << "\n";
  }
};

auto writer_task(syncoro::client<kv_store>& db, int id) -> iocoro::awaitable<void> {
  for (int i = 0; i < 3; ++i) {
    auto key = "user:" + std::to_string(id) + ":" + std::to_string(i);
    auto r = co_await db.exec([key](kv_store& s) { s.put(key, "v" + key); });
    if (!r) {
      std::cerr << "put failed: " << r.error().to_string() << "\n";
    }
  }
}

auto kv_store_task(syncoro::client<kv_store>& db) -> iocoro::awaitable<void> {
  auto cr = co_await db.connect();
  if (!cr) {
    std::cerr << "connect failed: " << cr.error().to_string() << "\n";
    co_return;
  }

  co_await writer_task(db, 0);

  auto n = co_await db.exec([](kv_store& s) { return s.size(); });
  if (n) {
    std::cout << "keys after local writes: " << *n << "\n";
  }

  auto missing = co_await db.exec([](kv_store& s) { return s.get("user:404"); });
  if (!missing) {
    std::cout << "lookup failed as expected: " << missing.error().to_string() << "\n";
  }

  auto hit = co_await db.exec([](kv_store& s) { return s.get("user:0:1"); });
  if (hit) {
    std::cout << "user:0:1 = " << *hit << "\n";
  }
}

auto close_task(syncoro::client<kv_store>& db) -> iocoro::awaitable<void> {
  auto r = co_await db.close();
  if (!r) {
    std::cerr << "close failed: " << r.error().to_string() << "\n";
  }
}

// Results arrive from the worker thread as posted messages, so keep the context alive with a
// work guard until the task itself is done.
auto run_to_completion(iocoro::io_context& ctx, iocoro::awaitable<void> task) -> void {
  auto guard = std::make_shared<iocoro::work_guard<iocoro::executor>>(ctx.get_executor());
  iocoro::co_spawn(ctx.get_executor(), std::move(task),
                   [guard](iocoro::expected<void, std::exception_ptr> r) {
                     guard->reset();
                     if (!r) {
                       std::cerr << "task failed with an exception\n";
                     }
                   });
  ctx.run();
}

int main() {
  syncoro::set_log_level(syncoro::log_level::info);

  syncoro::config cfg{};
  cfg.name = "kv";
  cfg.trace_hooks = {
    .user_data = nullptr,
    .on_start = nullptr,
    .on_finish = &trace_printer::on_finish,
  };

  syncoro::client<kv_store> db{[]() { return kv_store{"example"}; },
                               [](kv_store& s) { s.flush(); }, cfg};

  iocoro::io_context ctx;
  run_to_completion(ctx, kv_store_task(db));

  // A second event loop on another thread shares the same store.
  std::thread other([&db]() {
    iocoro::io_context other_ctx;
    run_to_completion(other_ctx, writer_task(db, 1));
  });
  other.join();

  iocoro::io_context close_ctx;
  run_to_completion(close_ctx, close_task(db));
  return 0;
}
