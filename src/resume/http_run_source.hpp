#pragma once

#include <asio.hpp>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "net/http_client.hpp"
#include "resume/run_source.hpp"

namespace acp {

// Runs served by the task API:
//   GET {base_url}/tasks/{task}/runs/{run}/                              run metadata
//   GET {log_url}                                                            log content
//   GET {base_url}/tasks/{task}/runs/{run}/artifacts/download?path=ref  archive bytes
// Absolute http(s) artifact references are fetched as they are.
class HttpRunSource : public RunSource, public std::enable_shared_from_this<HttpRunSource> {
 public:
  explicit HttpRunSource(ApiConfig config);

  ~HttpRunSource() override;

  std::future<RunMetadata> fetch_run(const TaskId& task_id, const RunId& run_id) override;

  std::future<std::string> fetch_log(const RunMetadata& run) override;

  std::shared_ptr<ArtifactFetcher> artifacts(const TaskId& task_id, const RunId& run_id) override;

  std::string run_url(const TaskId& task_id, const RunId& run_id) const;

  // GET `url`, throwing std::runtime_error for transport errors and non-2xx statuses
  std::future<std::string> get_body(const std::string& url, bool authorize);

 private:
  ApiConfig config_;
  asio::io_context io_ctx_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::unique_ptr<net::HttpClient> client_;
  std::thread io_thread_;
};

}  // namespace acp
