#pragma once

#include "ai/AiSession.h"
#include "ai/AiTransport.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

// What a FakeAiTransport saw, kept alive past the transport itself.
struct FakeAiLog {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<std::optional<AiEvent>> script; // nullopt = remote close
  bool cancelled = false;
  bool closed = false;

  // Transient transport errors: the next `failSends` sends throw, and every
  // receive throws while `failReceives` is set.
  int failSends = 0;
  bool failReceives = false;
  int receiveErrors = 0;

  std::vector<AudioChunk> sent;
  std::vector<std::string> texts;
  std::vector<ToolResult> toolResults;

  void setFailures(int sends, bool receives) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      failSends = sends;
      failReceives = receives;
    }
    cv.notify_all();
  }
  int pendingSendFailures() {
    std::lock_guard<std::mutex> lock(mutex);
    return failSends;
  }

  void push(std::optional<AiEvent> event) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      script.push_back(std::move(event));
    }
    cv.notify_all();
  }

  size_t sentCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent.size();
  }
  int receiveErrorCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return receiveErrors;
  }
  size_t toolResultCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return toolResults.size();
  }
};

class FakeAiTransport : public AiTransport {
public:
  explicit FakeAiTransport(std::shared_ptr<FakeAiLog> log)
      : log_(std::move(log)) {}

  void send(const AudioChunk &pcm) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    if (log_->failSends > 0) {
      log_->failSends--;
      throw AiTransportError("audio write failed");
    }
    log_->sent.push_back(pcm);
  }
  void sendText(const std::string &text) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->texts.push_back(text);
  }
  void respondToTool(const ToolResult &result) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->toolResults.push_back(result);
  }

  std::optional<AiEvent> receive() override {
    std::unique_lock<std::mutex> lock(log_->mutex);
    log_->cv.wait(lock, [this] {
      return !log_->script.empty() || log_->cancelled || log_->closed ||
             log_->failReceives;
    });
    if (log_->failReceives && !log_->cancelled && !log_->closed) {
      log_->receiveErrors++;
      throw AiTransportError("stream read failed");
    }
    if (log_->script.empty())
      return std::nullopt;
    auto event = std::move(log_->script.front());
    log_->script.pop_front();
    return event;
  }

  void cancel() override {
    {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->cancelled = true;
    }
    log_->cv.notify_all();
  }
  void close() override {
    {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->closed = true;
    }
    log_->cv.notify_all();
  }

private:
  std::shared_ptr<FakeAiLog> log_;
};

class FakeAiConnector : public AiConnector {
public:
  std::unique_ptr<AiTransport> connect(const AiSessionConfig &config) override {
    connects++;
    lastConfig = config;
    if (fail)
      return nullptr;
    log = std::make_shared<FakeAiLog>();
    return std::make_unique<FakeAiTransport>(log);
  }

  std::atomic<int> connects{0};
  bool fail = false;
  AiSessionConfig lastConfig;
  std::shared_ptr<FakeAiLog> log;
};
