#include "resume/http_run_source.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace acp {

namespace {

std::string trim_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

class HttpArtifactFetcher : public ArtifactFetcher {
 public:
  HttpArtifactFetcher(std::shared_ptr<HttpRunSource> source, std::string run_url) : source_(std::move(source)), run_url_(std::move(run_url)) {}

  std::future<std::string> download(const std::string& archive_ref) override {
    if (archive_ref.starts_with("http://") || archive_ref.starts_with("https://")) {
      return source_->get_body(archive_ref, false);
    }
    return source_->get_body(run_url_ + "artifacts/download?path=" + net::url_encode(archive_ref), true);
  }

 private:
  std::shared_ptr<HttpRunSource> source_;
  std::string run_url_;
};

}  // namespace

HttpRunSource::HttpRunSource(ApiConfig config)
    : config_(std::move(config)), work_(asio::make_work_guard(io_ctx_)), client_(std::make_unique<net::HttpClient>(io_ctx_)) {
  config_.base_url = trim_slash(config_.base_url);
  io_thread_ = std::thread([this]() {
    io_ctx_.run();
  });
}

HttpRunSource::~HttpRunSource() {
  work_.reset();
  io_ctx_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

std::string HttpRunSource::run_url(const TaskId& task_id, const RunId& run_id) const {
  return config_.base_url + "/tasks/" + net::url_encode(task_id) + "/runs/" + net::url_encode(run_id) + "/";
}

std::future<std::string> HttpRunSource::get_body(const std::string& url, bool authorize) {
  net::HttpOptions options;
  options.method = "GET";
  options.timeout = std::chrono::seconds(config_.timeout_seconds);
  if (authorize && !config_.api_key.empty()) {
    options.headers["Authorization"] = "Bearer " + config_.api_key;
  }

  // The client's resolver lives on the io thread; start the request there
  auto promise = std::make_shared<std::promise<net::HttpResponse>>();
  auto response = promise->get_future();
  asio::post(io_ctx_, [this, url, options, promise]() {
    client_->request(url, options, [promise](net::HttpResponse resp) {
      promise->set_value(std::move(resp));
    });
  });

  return std::async(std::launch::deferred, [url, response = std::move(response)]() mutable {
    net::HttpResponse resp = response.get();
    if (!resp.error.empty()) {
      throw std::runtime_error("GET " + url + ": " + resp.error);
    }
    if (!resp.ok()) {
      throw std::runtime_error("GET " + url + ": HTTP " + std::to_string(resp.status_code));
    }
    return std::move(resp.body);
  });
}

std::future<RunMetadata> HttpRunSource::fetch_run(const TaskId& task_id, const RunId& run_id) {
  std::string url = run_url(task_id, run_id);
  spdlog::debug("[HttpRunSource] Fetching run {}", url);

  auto body = get_body(url, true);
  return std::async(std::launch::deferred, [body = std::move(body), task_id, run_id]() mutable {
    RunMetadata run = RunMetadata::from_json(json::parse(body.get()));
    if (run.id.empty()) run.id = run_id;
    if (run.task_id.empty()) run.task_id = task_id;
    return run;
  });
}

std::future<std::string> HttpRunSource::fetch_log(const RunMetadata& run) {
  if (!run.log_url) {
    throw std::invalid_argument("Run " + run.id + " has no log");
  }
  // Log URLs are presigned; no credentials
  return get_body(*run.log_url, false);
}

std::shared_ptr<ArtifactFetcher> HttpRunSource::artifacts(const TaskId& task_id, const RunId& run_id) {
  return std::make_shared<HttpArtifactFetcher>(shared_from_this(), run_url(task_id, run_id));
}

}  // namespace acp
