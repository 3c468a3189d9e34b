// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "duet/call/role_arbitrator.h"

#include <algorithm>
#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "duet/call/call_session.h"
#include "duet/store/json_util.h"
#include "duet/util/status_macros.h"

namespace duet::call {

namespace {

using signalling::SessionDescription;
using signalling::SessionDocument;
using signalling::Side;

constexpr std::string_view kSource = "arbitrator";

std::string AnswerIdentity(const SessionDescription& answer) {
  return absl::StrCat(answer.updated_by, "@",
                      absl::ToUnixMillis(answer.updated_at));
}

std::optional<SessionDocument> ParseSessionDocument(
    const std::optional<store::Document>& data) {
  if (!data.has_value()) {
    return std::nullopt;
  }
  absl::StatusOr<SessionDocument> document = SessionDocument::FromJson(*data);
  if (!document.ok()) {
    LOG(WARNING) << "Malformed session document: " << document.status();
    return std::nullopt;
  }
  return *std::move(document);
}

}  // namespace

RoleArbitrator::RoleArbitrator(CallSession* session) : session_(session) {}

void RoleArbitrator::Start() {
  CallSession& session = *session_;
  session.store_->Get(
      session.paths_.session(),
      session.BindToEpoch(
          [this](absl::StatusOr<std::optional<store::Document>> data) {
            if (!data.ok()) {
              session_->Log(Severity::kWarning, kSource,
                            absl::StrCat("Could not read the session "
                                         "document: ",
                                         data.status().ToString()));
              Arbitrate(std::nullopt);
              return;
            }
            Arbitrate(ParseSessionDocument(*data));
          }));
}

void RoleArbitrator::Arbitrate(std::optional<SessionDocument> document) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;

  if (!document.has_value() || !document->offer.has_value()) {
    session.Log(Severity::kInfo, kSource,
                "No offer in the room; taking the offerer role.");
    PublishOffer({.reasons = {"initial"}});
    return;
  }
  const SessionDescription& offer = *document->offer;
  state.highest_seen_revision =
      std::max(state.highest_seen_revision, offer.revision);

  if (offer.updated_by == session.uid_) {
    session.Log(
        Severity::kWarning, kSource,
        document->IsSelfAuthored(session.uid_)
            ? "The room only holds state written by this endpoint; "
              "resetting it."
            : "The current offer was written by an earlier connection of "
              "this endpoint; replacing it.");
    PublishOffer({.reasons = {"self-authored-reset"}});
    return;
  }
  if (session.presence_.Find(offer.updated_by) == nullptr) {
    session.Log(Severity::kInfo, kSource,
                absl::StrCat("Offer author ", offer.updated_by,
                             " is not in the room; taking over."));
    PublishOffer({.reasons = {"stale-offer"}});
    return;
  }
  if (!document->answerer.empty() && document->answerer != session.uid_ &&
      session.presence_.Find(document->answerer) != nullptr) {
    EnterObserverMode(
        absl::StrCat("the answer slot is held by ", document->answerer));
    return;
  }
  AttemptAnswer(*std::move(document));
}

void RoleArbitrator::OnSessionDocument(std::optional<SessionDocument> document) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;

  if (state.negotiating) {
    state.deferred_document = std::move(document);
    return;
  }
  if (!document.has_value()) {
    if (state.role != Role::kNone) {
      session.Log(Severity::kInfo, kSource, "The session document was reset.");
    }
    return;
  }
  if (!document->offer.has_value()) {
    return;
  }
  const SessionDescription& offer = *document->offer;
  state.highest_seen_revision =
      std::max(state.highest_seen_revision, offer.revision);
  const bool own_offer = offer.updated_by == session.uid_;

  switch (state.role) {
    case Role::kNone:
      return;
    case Role::kOfferer:
      if (!own_offer && offer.revision > state.active_revision) {
        session.Log(Severity::kInfo, kSource,
                    absl::StrFormat("Offer revision %d of %s supersedes ours; "
                                    "answering it.",
                                    offer.revision, offer.updated_by));
        AttemptAnswer(*std::move(document));
        return;
      }
      if (own_offer && offer.revision == state.active_revision) {
        ApplyAnswer(*document);
      }
      return;
    case Role::kAnswerer:
      if (!own_offer && offer.revision > state.active_revision &&
          state.answer_state != AnswerState::kAwaitingRevision) {
        AttemptAnswer(*std::move(document));
      }
      return;
    case Role::kObserver:
      if (!own_offer) {
        AttemptAnswer(*std::move(document));
      }
      return;
  }
}

void RoleArbitrator::OnParticipantLeft(const std::string& uid) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;
  if (uid == session.uid_ || uid != state.remote_uid) {
    return;
  }
  if (state.role == Role::kOfferer) {
    session.Log(Severity::kInfo, kSource,
                absl::StrCat("Answerer ", uid,
                             " left; re-offering on a fresh transport."));
    state.remote_uid.clear();
    session.scheduler_.Request("peer-left", {.replace_transport = true});
  } else if (state.role == Role::kAnswerer) {
    session.Log(Severity::kInfo, kSource,
                absl::StrCat("Offerer ", uid, " left."));
    session.scheduler_.Request(
        "peer-left", {.require_offerer = true, .replace_transport = true});
  }
}

void RoleArbitrator::PublishOffer(RenegotiationBatch batch) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;
  const std::string reasons = absl::StrJoin(batch.reasons, ",");

  if (state.negotiating) {
    for (const std::string& reason : batch.reasons) {
      session.scheduler_.Request(
          reason, {.replace_transport = batch.replace_transport,
                   .ice_restart = batch.ice_restart});
    }
    return;
  }
  state.negotiating = true;

  net::MediaTransport* transport = session.transport_.get();
  const bool role_change =
      state.role != Role::kOfferer && state.role != Role::kNone;
  if (transport == nullptr || batch.replace_transport || role_change ||
      transport->signaling_state() != net::SignalingState::kStable) {
    if (absl::Status status = session.ReplaceTransport(reasons); !status.ok()) {
      AbortNegotiation("create transport", status);
      return;
    }
  }

  const int64_t revision =
      std::max(state.highest_seen_revision, state.last_offer_revision) + 1;
  state.active_revision = revision;
  state.applied_answer.clear();
  state.touched_revisions.insert(revision);
  session.trickle_.BeginLocal(revision, Side::kOffer);
  session.ledger_.EnsureRevision(
      revision, session.Bind([this, revision](absl::Status status) {
        if (!status.ok()) {
          session_->Log(Severity::kWarning, kSource,
                        absl::StrFormat("Could not mark revision %d: %s",
                                        revision, status.ToString()));
        }
      }));

  session.Log(Severity::kInfo, kSource,
              absl::StrFormat("Creating offer revision %d (%s).", revision,
                              reasons));
  session.transport_->CreateOffer(
      batch.ice_restart,
      session.BindToEpoch([this,
                           revision](absl::StatusOr<net::Description> offer) {
        if (!offer.ok()) {
          AbortNegotiation("create offer", offer.status());
          return;
        }
        std::string sdp = offer->sdp;
        session_->transport_->SetLocalDescription(
            *std::move(offer),
            session_->BindToEpoch([this, revision, sdp = std::move(sdp)](
                                      absl::Status status) mutable {
              if (!status.ok()) {
                AbortNegotiation("set local offer", status);
                return;
              }
              PrepareDescription(Side::kOffer, revision, std::move(sdp),
                                 [this](SessionDescription offer) {
                                   CommitOffer(std::move(offer));
                                 });
            }));
      }));
}

void RoleArbitrator::Promote(std::string_view reason) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;
  session.Log(Severity::kInfo, kSource,
              absl::StrCat("Promoting to offerer: ", reason));
  state.needs_promotion = true;
  state.answer_state = AnswerState::kIdle;
  state.answer_attempts = 0;
  PublishOffer({.reasons = {std::string(reason)}, .replace_transport = true});
}

void RoleArbitrator::CommitOffer(SessionDescription offer) {
  CallSession& session = *session_;
  const NegotiationState& state = session.state_;
  const int64_t revision = offer.revision;

  // Keep the answer slot bound to the current answerer across
  // renegotiations.
  std::string answerer;
  if (state.role == Role::kOfferer && !state.remote_uid.empty() &&
      session.presence_.Find(state.remote_uid) != nullptr) {
    answerer = state.remote_uid;
  }

  session.store_->RunTransaction(
      [path = session.paths_.session(), uid = session.uid_,
       offer = std::move(offer), answerer = std::move(answerer),
       now = session.loop_->Now()](store::Transaction& txn) -> absl::Status {
        ASSIGN_OR_RETURN(std::optional<store::Document> current,
                         txn.Get(path));
        if (current.has_value()) {
          absl::StatusOr<SessionDocument> existing =
              SessionDocument::FromJson(*current);
          if (existing.ok()) {
            if (existing->offer.has_value() &&
                existing->offer->updated_by != uid &&
                existing->offer->revision >= offer.revision) {
              return absl::AbortedError(absl::StrFormat(
                  "Offer revision %d of %s supersedes revision %d",
                  existing->offer->revision, existing->offer->updated_by,
                  offer.revision));
            }
            txn.Update(path, signalling::MakeOfferUpdate(offer, answerer));
            return absl::OkStatus();
          }
        }
        SessionDocument fresh;
        fresh.offer = offer;
        fresh.created_at = now;
        fresh.created_by = uid;
        fresh.answerer = answerer;
        txn.Set(path, fresh.ToJson());
        return absl::OkStatus();
      },
      session.BindToEpoch([this, revision](absl::Status status) {
        OnOfferCommitted(revision, std::move(status));
      }));
}

void RoleArbitrator::OnOfferCommitted(int64_t revision, absl::Status status) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;

  if (status.ok()) {
    publish_failures_ = 0;
    state.role = Role::kOfferer;
    state.last_offer_revision = revision;
    state.highest_seen_revision =
        std::max(state.highest_seen_revision, revision);
    state.needs_promotion = false;
    state.answer_state = AnswerState::kIdle;
    state.answer_attempts = 0;
    session.Log(Severity::kInfo, kSource,
                absl::StrFormat("Published offer revision %d.", revision));
    if (state.remote_uid.empty()) {
      session.SetStatus("Waiting for others");
    } else {
      ShowConnecting();
    }
    session.gc_.PurgeSuperseded(
        revision, session.Bind([this](absl::Status status) {
          if (!status.ok()) {
            session_->Log(Severity::kWarning, "gc",
                          absl::StrCat("Superseded artifacts remain: ",
                                       status.ToString()));
          }
        }));
    FinishNegotiation();
    return;
  }

  if (absl::IsAborted(status)) {
    session.Log(Severity::kInfo, kSource,
                absl::StrCat(status.message(), "; answering instead."));
    state.negotiating = false;
    state.deferred_document.reset();
    session.store_->Get(
        session.paths_.session(),
        session.BindToEpoch(
            [this](absl::StatusOr<std::optional<store::Document>> data) {
              std::optional<SessionDocument> document;
              if (data.ok()) {
                document = ParseSessionDocument(*data);
              }
              if (document.has_value() && document->offer.has_value() &&
                  document->offer->updated_by != session_->uid_) {
                session_->state_.highest_seen_revision =
                    std::max(session_->state_.highest_seen_revision,
                             document->offer->revision);
                AttemptAnswer(*std::move(document));
                return;
              }
              PublishOffer({.reasons = {"offer-retry"}});
            }));
    return;
  }

  ++publish_failures_;
  AbortNegotiation("publish offer", status);
  if (publish_failures_ >= kMaxAnswerAttempts) {
    publish_failures_ = 0;
    session.ReportError(status);
    return;
  }
  session.loop_->PostAfter(
      session.config_.renegotiation_debounce, session.BindToEpoch([this]() {
        if (session_->state_.role == Role::kNone ||
            session_->state_.role == Role::kOfferer) {
          PublishOffer({.reasons = {"offer-retry"}});
        }
      }));
}

void RoleArbitrator::AttemptAnswer(SessionDocument document) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;

  if (state.negotiating) {
    state.deferred_document = std::move(document);
    return;
  }
  if (!document.offer.has_value()) {
    return;
  }
  if (!document.answerer.empty() && document.answerer != session.uid_ &&
      session.presence_.Find(document.answerer) != nullptr) {
    if (state.role != Role::kObserver) {
      EnterObserverMode(
          absl::StrCat("the answer slot is held by ", document.answerer));
    }
    return;
  }
  const SessionDescription offer = *document.offer;
  if (session.presence_.Find(offer.updated_by) == nullptr) {
    Promote("stale-offer");
    return;
  }

  state.negotiating = true;
  state.answer_state = AnswerState::kAttemptingAnswer;
  ++state.answer_attempts;
  state.highest_seen_revision =
      std::max(state.highest_seen_revision, offer.revision);

  net::MediaTransport* transport = session.transport_.get();
  if (transport == nullptr || state.role == Role::kOfferer ||
      transport->signaling_state() != net::SignalingState::kStable) {
    if (absl::Status status = session.ReplaceTransport("answering an offer");
        !status.ok()) {
      AbortNegotiation("create transport", status);
      return;
    }
  }

  state.role = Role::kAnswerer;
  state.remote_uid = offer.updated_by;
  state.active_revision = offer.revision;
  state.applied_answer.clear();
  state.touched_revisions.insert(offer.revision);
  session.trickle_.BeginLocal(offer.revision, Side::kAnswer);
  session.trickle_.BindRemote(offer.revision, Side::kOffer, offer.updated_by);

  session.Log(Severity::kInfo, kSource,
              absl::StrFormat("Answering offer revision %d of %s "
                              "(attempt %d of %d).",
                              offer.revision, offer.updated_by,
                              state.answer_attempts,
                              session.config_.max_answer_attempts));

  const int64_t revision = offer.revision;
  ResolveSdp(offer, session.BindToEpoch([this, revision](
                                            absl::StatusOr<std::string> sdp) {
    if (!sdp.ok()) {
      session_->Log(Severity::kWarning, kSource,
                    absl::StrFormat("Offer revision %d is unreadable: %s",
                                    revision, sdp.status().ToString()));
      session_->state_.negotiating = false;
      Promote("unreadable-offer");
      return;
    }
    session_->transport_->SetRemoteDescription(
        {net::SdpType::kOffer, *std::move(sdp)},
        session_->BindToEpoch([this, revision](absl::Status status) {
          if (!status.ok()) {
            FailAnswerAttempt(status);
            return;
          }
          session_->trickle_.OnRemoteDescriptionSet();
          session_->transport_->CreateAnswer(session_->BindToEpoch(
              [this, revision](absl::StatusOr<net::Description> answer) {
                if (!answer.ok()) {
                  FailAnswerAttempt(answer.status());
                  return;
                }
                std::string sdp = answer->sdp;
                session_->transport_->SetLocalDescription(
                    *std::move(answer),
                    session_->BindToEpoch([this, revision,
                                           sdp = std::move(sdp)](
                                              absl::Status status) mutable {
                      if (!status.ok()) {
                        FailAnswerAttempt(status);
                        return;
                      }
                      PrepareDescription(Side::kAnswer, revision,
                                         std::move(sdp),
                                         [this](SessionDescription answer) {
                                           CommitAnswer(std::move(answer));
                                         });
                    }));
              }));
        }));
  }));
}

void RoleArbitrator::CommitAnswer(SessionDescription answer) {
  CallSession& session = *session_;
  const int64_t revision = answer.revision;

  session.store_->RunTransaction(
      [paths = session.paths_, uid = session.uid_,
       answer = std::move(answer)](store::Transaction& txn) -> absl::Status {
        ASSIGN_OR_RETURN(std::optional<store::Document> current,
                         txn.Get(paths.session()));
        if (!current.has_value()) {
          return absl::AbortedError("The session document disappeared");
        }
        ASSIGN_OR_RETURN(SessionDocument document,
                         SessionDocument::FromJson(*current));
        if (document.offer_revision() != answer.revision) {
          return absl::AbortedError(
              absl::StrFormat("Offer moved from revision %d to %d",
                              answer.revision, document.offer_revision()));
        }
        if (!document.answerer.empty() && document.answerer != uid) {
          ASSIGN_OR_RETURN(std::optional<store::Document> holder,
                           txn.Get(paths.participant(document.answerer)));
          if (holder.has_value() &&
              store::GetString(*holder, "status", "active") == "active") {
            return absl::ResourceExhaustedError(absl::StrCat(
                "The answer slot is held by ", document.answerer));
          }
        }
        boost::json::object update;
        update["answer"] = answer.ToJson();
        update["answerer"] = uid;
        txn.Update(paths.session(), std::move(update));
        return absl::OkStatus();
      },
      session.BindToEpoch([this, revision](absl::Status status) {
        CallSession& session = *session_;
        NegotiationState& state = session.state_;
        if (status.ok()) {
          state.last_answer_revision = revision;
          state.answer_state = AnswerState::kIdle;
          state.answer_attempts = 0;
          session.Log(Severity::kInfo, kSource,
                      absl::StrFormat("Published answer revision %d.",
                                      revision));
          ShowConnecting();
          FinishNegotiation();
          return;
        }
        if (absl::IsResourceExhausted(status)) {
          state.negotiating = false;
          EnterObserverMode(status.message());
          return;
        }
        FailAnswerAttempt(status);
      }));
}

void RoleArbitrator::FailAnswerAttempt(const absl::Status& status) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;
  state.negotiating = false;
  session.Log(Severity::kWarning, kSource,
              absl::StrFormat("Answer attempt %d of %d failed: %s",
                              state.answer_attempts,
                              session.config_.max_answer_attempts,
                              status.ToString()));
  if (state.answer_attempts >= session.config_.max_answer_attempts) {
    state.answer_state = AnswerState::kFailed;
    Promote("answer-attempts-exhausted");
    return;
  }
  state.answer_state = AnswerState::kAwaitingRevision;
  AwaitRevision();
}

void RoleArbitrator::AwaitRevision() {
  CallSession& session = *session_;
  session.store_->Get(
      session.paths_.session(),
      session.BindToEpoch(
          [this](absl::StatusOr<std::optional<store::Document>> data) {
            NegotiationState& state = session_->state_;
            if (state.negotiating ||
                state.answer_state != AnswerState::kAwaitingRevision) {
              return;
            }
            state.deferred_document.reset();
            std::optional<SessionDocument> document;
            if (data.ok()) {
              document = ParseSessionDocument(*data);
            }
            if (!document.has_value() || !document->offer.has_value() ||
                document->offer->updated_by == session_->uid_) {
              state.answer_state = AnswerState::kIdle;
              Promote("offer-missing");
              return;
            }
            AttemptAnswer(*std::move(document));
          }));
}

void RoleArbitrator::ApplyAnswer(const SessionDocument& document) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;
  if (!document.answer.has_value()) {
    return;
  }
  const SessionDescription& answer = *document.answer;
  if (answer.updated_by == session.uid_) {
    return;
  }
  if (answer.revision != state.active_revision) {
    session.Log(Severity::kInfo, kSource,
                absl::StrFormat("Ignoring an answer to revision %d; the "
                                "active revision is %d.",
                                answer.revision, state.active_revision));
    return;
  }
  const std::string identity = AnswerIdentity(answer);
  if (identity == state.applied_answer || session.transport_ == nullptr) {
    return;
  }
  if (session.transport_->signaling_state() !=
      net::SignalingState::kHaveLocalOffer) {
    if (!state.applied_answer.empty()) {
      session.Log(Severity::kInfo, kSource,
                  absl::StrCat("Answer of ", answer.updated_by,
                               " replaced the applied one; renegotiating."));
      state.applied_answer = identity;
      session.scheduler_.Request("answer-replaced",
                                 {.replace_transport = true});
    }
    return;
  }

  state.negotiating = true;
  state.applied_answer = identity;
  const int64_t revision = answer.revision;
  ResolveSdp(answer, session.BindToEpoch([this, revision,
                                          author = answer.updated_by](
                                             absl::StatusOr<std::string> sdp) {
    if (!sdp.ok()) {
      session_->state_.applied_answer.clear();
      AbortNegotiation("read answer", sdp.status());
      session_->scheduler_.Request("unreadable-answer",
                                   {.replace_transport = true});
      return;
    }
    session_->transport_->SetRemoteDescription(
        {net::SdpType::kAnswer, *std::move(sdp)},
        session_->BindToEpoch([this, revision,
                               author](absl::Status status) {
          CallSession& session = *session_;
          if (!status.ok()) {
            AbortNegotiation("apply answer", status);
            session.scheduler_.Request("answer-rejected",
                                       {.replace_transport = true});
            return;
          }
          NegotiationState& state = session.state_;
          state.last_answer_revision = revision;
          state.remote_uid = author;
          session.trickle_.BindRemote(revision, Side::kAnswer, author);
          session.trickle_.OnRemoteDescriptionSet();
          session.Log(Severity::kInfo, kSource,
                      absl::StrFormat("Applied answer revision %d of %s.",
                                      revision, author));
          ShowConnecting();
          FinishNegotiation();
        }));
  }));
}

void RoleArbitrator::EnterObserverMode(std::string_view reason) {
  CallSession& session = *session_;
  NegotiationState& state = session.state_;
  state.role = Role::kObserver;
  state.answer_state = AnswerState::kIdle;
  state.answer_attempts = 0;
  state.active_revision = 0;
  state.remote_uid.clear();
  session.trickle_.Reset();
  session.CloseTransport();
  session.Log(Severity::kInfo, kSource,
              absl::StrCat("Observing the call: ", reason));
  session.SetStatus("Call is full");
}

void RoleArbitrator::ResolveSdp(const SessionDescription& description,
                                SdpCallback done) {
  CallSession& session = *session_;
  if (description.sdp_ref.empty() ||
      (!session.side_channel_enabled_ && description.has_inline_sdp())) {
    if (description.has_inline_sdp()) {
      std::move(done)(description.sdp);
    } else {
      std::move(done)(absl::NotFoundError("The description has no SDP."));
    }
    return;
  }
  session.store_->Get(
      description.sdp_ref,
      session.Bind([this, ref = description.sdp_ref,
                    author = description.updated_by,
                    inline_sdp = description.sdp, done = std::move(done)](
                       absl::StatusOr<std::optional<store::Document>>
                           payload) mutable {
        // Racing offerers share the path of a revision; only the copy
        // written by the description's author is usable.
        if (payload.ok() && payload->has_value() &&
            store::GetString(**payload, "author") == author) {
          std::string sdp = store::GetString(**payload, "sdp");
          if (!sdp.empty()) {
            std::move(done)(std::move(sdp));
            return;
          }
        }
        absl::Status failure =
            !payload.ok() ? payload.status()
                          : absl::NotFoundError(absl::StrCat(
                                ref, " holds no SDP written by ", author));
        if (absl::IsPermissionDenied(failure)) {
          DisableSideChannel(failure);
        }
        if (inline_sdp.empty()) {
          std::move(done)(std::move(failure));
          return;
        }
        session_->Log(Severity::kWarning, kSource,
                      absl::StrCat("Side-channel description unavailable (",
                                   failure.ToString(),
                                   "); using the inline copy."));
        std::move(done)(std::move(inline_sdp));
      }));
}

void RoleArbitrator::PrepareDescription(Side side, int64_t revision,
                                        std::string sdp,
                                        PreparedCallback done) {
  CallSession& session = *session_;
  SessionDescription description;
  description.type = side;
  description.revision = revision;
  description.updated_at = session.loop_->Now();
  description.updated_by = session.uid_;

  if (!session.side_channel_enabled_) {
    description.sdp = std::move(sdp);
    std::move(done)(std::move(description));
    return;
  }

  const std::string path = session.paths_.description(side, revision);
  boost::json::object payload;
  payload["type"] = signalling::SideName(side);
  payload["sdp"] = sdp;
  payload["revision"] = revision;
  payload["author"] = session.uid_;
  payload["updatedAt"] = store::TimeToJson(description.updated_at);
  session.store_->Set(
      path, std::move(payload),
      session.BindToEpoch([this, path, description = std::move(description),
                           sdp = std::move(sdp), done = std::move(done)](
                              absl::Status status) mutable {
        if (status.ok()) {
          description.sdp_ref = path;
          if (sdp.size() <= signalling::kMaxInlineSdpBytes) {
            description.sdp = std::move(sdp);
          }
        } else {
          if (absl::IsPermissionDenied(status)) {
            DisableSideChannel(status);
          } else {
            session_->Log(Severity::kWarning, kSource,
                          absl::StrCat("Could not write ", path, ": ",
                                       status.ToString()));
          }
          description.sdp = std::move(sdp);
        }
        std::move(done)(std::move(description));
      }));
}

void RoleArbitrator::DisableSideChannel(const absl::Status& cause) {
  if (!session_->side_channel_enabled_) {
    return;
  }
  session_->side_channel_enabled_ = false;
  session_->Log(Severity::kWarning, kSource,
                absl::StrCat("Side channel denied (", cause.ToString(),
                             "); embedding descriptions inline."));
}

void RoleArbitrator::ShowConnecting() {
  if (session_->connection_state() != net::ConnectionState::kConnected) {
    session_->SetStatus("Connecting");
  }
}

void RoleArbitrator::FinishNegotiation() {
  NegotiationState& state = session_->state_;
  state.negotiating = false;
  if (state.deferred_document.has_value()) {
    std::optional<SessionDocument> document =
        std::move(*state.deferred_document);
    state.deferred_document.reset();
    OnSessionDocument(std::move(document));
  }
  if (!state.negotiating) {
    session_->scheduler_.OnNegotiationFinished();
  }
}

void RoleArbitrator::AbortNegotiation(std::string_view step,
                                      const absl::Status& status) {
  session_->Log(Severity::kWarning, kSource,
                absl::StrCat("Negotiation step '", step,
                             "' failed: ", status.ToString()));
  FinishNegotiation();
}

}  // namespace duet::call
