#include "AuditLog.h"

#include <stdexcept>
#include <system_error>
#include <glog/logging.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/logging/AsyncFileWriter.h>
#include <folly/synchronization/Hazptr.h>
#include <folly/synchronization/HazptrHolder.h>

using folly::StringPiece;

class AuditLogWriter : public folly::AsyncFileWriter
                     , public folly::hazptr_obj_base<AuditLogWriter>
{
 public:
  using folly::AsyncFileWriter::AsyncFileWriter;
};

AuditLogStore::AuditLogStore(std::shared_ptr<CheckResultStore> upstream,
                             const std::string &path)
  : upstream_(std::move(upstream))
  , path_(path)
{
  rotate();
}

AuditLogStore::~AuditLogStore() {
  if (auto veteran = writer_.exchange(nullptr)) {
    LOG(INFO) << "Flushing audit log";
    veteran->flush();
    veteran->retire();
  }
}

void AuditLogStore::rotate()
try {
  if (path_.empty())
    return;

  LOG(INFO) << "Opening audit log " << path_;
  auto recruit = std::make_unique<AuditLogWriter>(path_);
  auto veteran = writer_.exchange(recruit.release());
  if (veteran) {
    veteran->flush();
    veteran->retire();
  }
} catch (const std::system_error& e) {
  LOG(ERROR) << "Could not open audit log file: " << e.what();
}

void AuditLogStore::flush() {
  folly::hazptr_holder<> h;
  if (auto log = h.get_protected(writer_))
    log->flush();
}

void AuditLogStore::append(std::string line) {
  line += '\n';
  folly::hazptr_holder<> h;
  if (auto log = h.get_protected(writer_))
    log->writeMessage(std::move(line));
  else if (!path_.empty())
    throw std::runtime_error("audit log " + path_ + " is not open");
}

void AuditLogStore::saveCheckResult(const FraudCheckResult &result) {
  append(folly::toJson(folly::dynamic::object
                         ("kind", "check_result")
                         ("result", toJson(result))));
  if (upstream_)
    upstream_->saveCheckResult(result);
}

std::vector<FraudCheckResult>
AuditLogStore::getCheckHistory(StringPiece entityId, size_t limit) {
  if (!upstream_)
    return {};
  return upstream_->getCheckHistory(entityId, limit);
}

void AuditLogStore::saveFraudReport(const FraudReport &report) {
  append(folly::toJson(folly::dynamic::object
                         ("kind", "fraud_report")
                         ("report", toJson(report))));
  if (upstream_)
    upstream_->saveFraudReport(report);
}
