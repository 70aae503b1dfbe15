#pragma once
#include <optional>
#include <string>
#include "core/types.hpp"
#include "scheduler/gas_escalator.hpp"

struct UnsignedTransaction {
  NetworkId network;
  std::string to;
  std::string data;
  std::string value = "0x0";
  unsigned long long gas_limit = 0;          // 0: submitter estimates
  GasParams fees;                            // unset: submitter prices
  std::optional<unsigned long long> nonce;   // unset: submitter assigns
};

struct SubmitResult {
  enum class Status { kSubmitted, kSigningError, kSubmissionError };
  Status status = Status::kSubmissionError;
  std::string tx_hash;
  std::string error;   // collaborator's message, verbatim
  GasParams fees_used;

  bool ok() const { return status == Status::kSubmitted; }
  static SubmitResult Submitted(std::string hash, GasParams fees = GasParams()) {
    SubmitResult r; r.status = Status::kSubmitted; r.tx_hash = std::move(hash); r.fees_used = fees; return r;
  }
  static SubmitResult Failed(Status status, std::string error, GasParams fees = GasParams()) {
    SubmitResult r; r.status = status; r.error = std::move(error); r.fees_used = fees; return r;
  }
};

enum class ReceiptStatus { kPending, kConfirmed, kReverted };

struct Receipt {
  ReceiptStatus status = ReceiptStatus::kPending;
  std::optional<long double> amount_out; // token_out received by the recipient, when observable
  unsigned long long gas_used = 0;
};

// Signing and broadcasting collaborator. SignAndSubmit reports failures in
// its result; GetReceipt may throw on transport errors.
class TransactionSubmitter {
public:
  virtual ~TransactionSubmitter() = default;
  virtual SubmitResult SignAndSubmit(const UnsignedTransaction& tx) = 0;
  virtual Receipt GetReceipt(const NetworkId& network,
                             const std::string& tx_hash,
                             const std::string& token_out,
                             const std::string& recipient) = 0;
  // Account the submitter signs for; used as the default swap recipient.
  virtual std::string Address() const = 0;
};

// Node rejections worth retrying with fresh nonce and bumped fees.
bool IsTransientSubmissionError(const std::string& message);
