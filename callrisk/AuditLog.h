#ifndef CALLRISK_AUDIT_LOG_H
#define CALLRISK_AUDIT_LOG_H

#include <atomic>
#include <memory>
#include <string>

#include "Collaborators.h"

class AuditLogWriter;

/*
 * CheckResultStore that appends every check result and fraud report as
 * one JSON line to an audit file, then forwards to the wrapped store.
 * History queries are answered by the wrapped store only.
 */
class AuditLogStore final : public CheckResultStore {
 public:
  AuditLogStore(std::shared_ptr<CheckResultStore> upstream, const std::string &path);
  ~AuditLogStore() override;

  void saveCheckResult(const FraudCheckResult &result) override;
  std::vector<FraudCheckResult>
    getCheckHistory(folly::StringPiece entityId, size_t limit) override;
  void saveFraudReport(const FraudReport &report) override;

  /** Reopen the audit file, e.g. after it was moved away. */
  void rotate();
  void flush();

 private:
  void append(std::string line);

  std::shared_ptr<CheckResultStore> upstream_;
  const std::string path_;
  std::atomic<AuditLogWriter*> writer_{nullptr};
};

#endif // CALLRISK_AUDIT_LOG_H
