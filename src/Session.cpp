#include "fnprof/Session.hpp"
#include "fnprof/Log.hpp"
#include "fnprof/ReportWriter.hpp"

using namespace fnprof;

Session::Session(Hooks& hooks, Introspector& introspector, Clock& clock, const Options& opt)
  : hooks_(hooks),
    introspector_(introspector),
    hook_frequency_(opt.hook_frequency),
    sort_method_(opt.sort_method),
    report_path_(opt.report_path),
    correlator_(registry_, clock) {}

Session::~Session() {
  std::lock_guard<std::mutex> lk(control_mu_);
  if (active_) hooks_.remove();
}

void Session::start(StartMode mode) {
  std::lock_guard<std::mutex> lk(control_mu_);
  if (mode == StartMode::Once) {
    if (should_return()) return;
    run_once_ = true;
  }
  finished_ = false;
  if (active_) {
    log_debug("start: hooks already installed");
    return;
  }
  if (!hooks_.install(*this, hook_frequency_)) {
    log_error("start: could not install function hooks");
    return;
  }
  active_ = true;
}

void Session::stop() {
  std::lock_guard<std::mutex> lk(control_mu_);
  if (should_return() || !active_) return;
  // Waits for in-flight events, which only take mu_.
  hooks_.remove();
  active_ = false;
  finished_ = true;
}

void Session::reset() {
  std::lock_guard<std::mutex> lk(control_mu_);
  finished_ = false;
  run_once_ = false;
  std::lock_guard<std::mutex> reg(mu_);
  registry_.clear();
}

bool Session::write_report() {
  return write_report(report_path());
}

bool Session::write_report(const std::string& path) {
  std::lock_guard<std::mutex> lk(control_mu_);
  std::lock_guard<std::mutex> reg(mu_);
  registry_.sort(sort_method_);
  if (!write_report_file(path, registry_.reports())) return false;
  log_info("Report written to %s", path.c_str());
  return true;
}

void Session::set_hook_frequency(unsigned n) {
  std::lock_guard<std::mutex> lk(control_mu_);
  hook_frequency_ = n;
}

void Session::set_sort_method(SortMethod method) {
  std::lock_guard<std::mutex> lk(control_mu_);
  sort_method_ = method;
}

bool Session::set_sort_method(std::string_view name) {
  auto m = parse_sort_method(name);
  if (!m) {
    log_warn("unknown sort method '%.*s', keeping %s", static_cast<int>(name.size()),
             name.data(), to_string(sort_method()));
    return false;
  }
  set_sort_method(*m);
  return true;
}

void Session::set_report_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(control_mu_);
  report_path_ = path;
}

bool Session::active() const {
  std::lock_guard<std::mutex> lk(control_mu_);
  return active_;
}

bool Session::finished() const {
  std::lock_guard<std::mutex> lk(control_mu_);
  return finished_;
}

bool Session::run_once() const {
  std::lock_guard<std::mutex> lk(control_mu_);
  return run_once_;
}

unsigned Session::hook_frequency() const {
  std::lock_guard<std::mutex> lk(control_mu_);
  return hook_frequency_;
}

SortMethod Session::sort_method() const {
  std::lock_guard<std::mutex> lk(control_mu_);
  return sort_method_;
}

std::string Session::report_path() const {
  std::lock_guard<std::mutex> lk(control_mu_);
  return report_path_;
}

void Session::on_call(const void* fn) {
  const FunctionIdentity& id = introspector_.describe(fn);
  std::lock_guard<std::mutex> lk(mu_);
  correlator_.on_call(id);
  events_.fetch_add(1, std::memory_order_relaxed);
}

void Session::on_return(const void* fn) {
  const FunctionIdentity& id = introspector_.describe(fn);
  std::lock_guard<std::mutex> lk(mu_);
  correlator_.on_return(id);
  events_.fetch_add(1, std::memory_order_relaxed);
}
