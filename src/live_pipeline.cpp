#include "live_pipeline.hpp"
#include <iostream>
#include <memory>
#include <utility>

LivePipeline::LivePipeline(std::unique_ptr<AudioSource> source,
                           Transcriber& transcriber,
                           const Config& config)
    : config_(config),
      source_(std::move(source)),
      buffer_(makeAmplitudeGate(config.silence_threshold)),
      loop_(buffer_, transcriber, log_, token_, config.loop) {
}

LivePipeline::~LivePipeline() {
    shutdown();
}

ConsumerTask& LivePipeline::addConsumer(std::unique_ptr<SegmentSink> sink) {
    consumers_.push_back(std::make_unique<ConsumerTask>(
        log_, std::move(sink), token_, config_.consumer_poll_interval));
    return *consumers_.back();
}

void LivePipeline::start(const std::string& device_selector) {
    if (running_) {
        return;
    }

    for (auto& consumer : consumers_) {
        consumer->start();
    }
    loop_.start();

    try {
        source_->start(device_selector,
                       [this](AudioFrame&& frame) {
                           if (!token_.stopRequested()) {
                               buffer_.offer(std::move(frame));
                           }
                       },
                       [this](const StreamFault& fault) {
                           onFault(fault);
                       });
    } catch (const DeviceError&) {
        shutdown();
        throw;
    }

    running_ = true;
    std::cout << "[LivePipeline] Capturing from " << source_->backendName() << " with "
              << consumers_.size() << " consumer(s)" << std::endl;
}

void LivePipeline::shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    token_.requestStop();
    source_->stop();
    loop_.stop();
    for (auto& consumer : consumers_) {
        consumer->stop();
    }

    running_ = false;
}

void LivePipeline::onFault(const StreamFault& fault) {
    // Called on the capture thread, teardown happens on the controlling thread
    {
        std::lock_guard<std::mutex> lock(fault_mutex_);
        fault_message_ = fault.what();
    }
    faulted_ = true;
}

std::string LivePipeline::faultMessage() const {
    std::lock_guard<std::mutex> lock(fault_mutex_);
    return fault_message_;
}

void LivePipeline::checkHealth() {
    if (running_ && !faulted_) {
        source_->checkHealth();
    }
}

bool LivePipeline::drained() const {
    if (!buffer_.empty() || loop_.state() != SegmentationLoop::State::IDLE) {
        return false;
    }
    for (const auto& consumer : consumers_) {
        if (consumer->backlog() > 0) {
            return false;
        }
    }
    return true;
}
