#include "kappa/core/curvature/streaming.hpp"

#include "curvature_internal.hpp"
#include "kappa/core/common/logger.hpp"

#include <sstream>
#include <utility>

namespace kappa::core {

namespace {

detail::HeadingNode toHeadingNode(double t, double heading, double speed) {
  detail::HeadingNode node;
  node.t = t;
  node.heading = heading;
  node.speed = speed;
  return node;
}

}  // namespace

StreamingCurvatureExtractor::StreamingCurvatureExtractor(CurvatureOptions opt)
    : opt_(std::move(opt)) {}

Status StreamingCurvatureExtractor::fail(Status st) {
  failed_ = true;
  report_ = CurvatureReport{};
  return st;
}

Status StreamingCurvatureExtractor::push(const MotionSample& sample,
                                         std::vector<CurvatureSample>* out) {
  if (!out) {
    log(LogLevel::Error, "StreamingCurvatureExtractor::push: output is null");
    return Status::InvalidParameter;
  }
  if (failed_ || finished_) {
    log(LogLevel::Error, "StreamingCurvatureExtractor::push: extractor needs reset()");
    return Status::Failure;
  }
  if (pushed_ == 0) {
    const Status st = validateCurvatureOptions(opt_);
    if (!ok(st)) return fail(st);
  }

  detail::HeadingNode node;
  const Status st = detail::prepareSample(sample, pushed_, opt_,
                                          "StreamingCurvatureExtractor::push", &node, &report_);
  if (!ok(st)) return fail(st);

  if (cur_ && node.t < cur_->t) {
    std::ostringstream oss;
    oss << "StreamingCurvatureExtractor::push: timestamp " << node.t << " at sample " << pushed_
        << " precedes " << cur_->t;
    log(LogLevel::Error, oss.str());
    return fail(Status::UnorderedTimestamps);
  }

  node.heading = unwrapper_.next(node.heading);
  const Node incoming{node.t, node.heading, node.speed};

  if (cur_) {
    const detail::HeadingNode cur = toHeadingNode(cur_->t, cur_->heading, cur_->speed);
    const detail::HeadingNode next = node;
    if (prev_) {
      const detail::HeadingNode prev = toHeadingNode(prev_->t, prev_->heading, prev_->speed);
      out->push_back(detail::curvatureAt(&prev, cur, &next, opt_, &report_));
    } else {
      out->push_back(detail::curvatureAt(nullptr, cur, &next, opt_, &report_));
    }
  }

  prev_ = cur_;
  cur_ = incoming;
  ++pushed_;
  return Status::Success;
}

Status StreamingCurvatureExtractor::finish(std::vector<CurvatureSample>* out) {
  if (!out) {
    log(LogLevel::Error, "StreamingCurvatureExtractor::finish: output is null");
    return Status::InvalidParameter;
  }
  if (failed_ || finished_) {
    log(LogLevel::Error, "StreamingCurvatureExtractor::finish: extractor needs reset()");
    return Status::Failure;
  }
  if (pushed_ < 2) {
    std::ostringstream oss;
    oss << "StreamingCurvatureExtractor::finish: need at least 2 samples, got " << pushed_;
    log(LogLevel::Error, oss.str());
    return fail(Status::InsufficientSamples);
  }

  const detail::HeadingNode prev = toHeadingNode(prev_->t, prev_->heading, prev_->speed);
  const detail::HeadingNode cur = toHeadingNode(cur_->t, cur_->heading, cur_->speed);
  out->push_back(detail::curvatureAt(&prev, cur, nullptr, opt_, &report_));
  finished_ = true;

  if (report_.normalized_count > 0) {
    std::ostringstream oss;
    oss << "StreamingCurvatureExtractor: normalized " << report_.normalized_count
        << " orientation(s), max deviation " << report_.max_norm_deviation;
    log(LogLevel::Warn, oss.str());
  }
  return Status::Success;
}

void StreamingCurvatureExtractor::reset() {
  report_ = CurvatureReport{};
  pushed_ = 0;
  failed_ = false;
  finished_ = false;
  unwrapper_.reset();
  prev_.reset();
  cur_.reset();
}

}  // namespace kappa::core
