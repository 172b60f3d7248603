#include "TransferEngine.h"

#include "Crypto.h"
#include "Exceptions.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <deque>
#include <future>
#include <memory>
#include <unordered_set>

namespace GlobalSend {

TransferResult TransferEngine::receive(const SyncManifest& baseline, Reassembler& reassembler) {
    TransferResult result;
    try {
        runReceiver(baseline, reassembler, result);
    } catch (const ChannelInterrupted& e) {
        Logger::instance().warn(std::string("Channel lost, partial files kept: ") + e.what(), "TransferEngine");
        result.status = TransferStatus::Interrupted;
    } catch (const SessionAbortedError& e) {
        if (e.peerCode() != ErrorCode::CANCELLED) {
            handleFatal(e);
            throw;
        }
        Logger::instance().info("Sender cancelled the transfer; partial files kept", "TransferEngine");
        result.status = TransferStatus::Cancelled;
    } catch (const GlobalSendError& e) {
        handleFatal(e);
        throw;
    }
    result.filesCommitted = reassembler.filesCommitted();
    return result;
}

void TransferEngine::runReceiver(const SyncManifest& baseline, Reassembler& reassembler, TransferResult& result) {
    const OfferMessage offer = SyncProtocol::decodeOffer(receiveControl());
    LOG_INFO_COMP_IF("Offer of " + std::to_string(offer.target.fileCount()) + " files (" +
                     std::to_string(offer.target.totalBytes()) + " bytes)", "TransferEngine");
    sendControl(SyncProtocol::encodeBaseline(baseline));

    const PlanMessage plan = SyncProtocol::decodePlan(receiveControl());
    result.jobId = plan.jobId;

    ReadyMessage ready;
    ready.need = reassembler.begin(offer.target, baseline, plan.plan);
    const std::unordered_set<ChunkId> needed(ready.need.begin(), ready.need.end());
    std::unordered_set<ChunkId> listed;
    for (const auto& ref : plan.plan.chunksToSend) {
        if (needed.count(ref.id) == 0 && listed.insert(ref.id).second) {
            ready.have.push_back(ref.id);
        }
    }
    result.resumed = !ready.have.empty();
    sendControl(SyncProtocol::encodeReady(ready));

    while (true) {
        if (cancelled_) {
            sendAbortQuietly(ErrorCode::CANCELLED, "cancelled by receiver");
            result.status = TransferStatus::Cancelled;
            return;
        }

        const std::vector<uint8_t> message = receiveControl();
        switch (SyncProtocol::typeOf(message)) {
            case MessageType::Batch:
                if (!receiveBatch(SyncProtocol::decodeBatch(message), reassembler, result)) {
                    sendAbortQuietly(ErrorCode::CANCELLED, "cancelled by receiver");
                    result.status = TransferStatus::Cancelled;
                    return;
                }
                break;

            case MessageType::Done: {
                const std::vector<ChunkId> requeued = reassembler.finish();
                ++result.rounds;
                sendControl(SyncProtocol::encodeComplete(requeued));
                if (requeued.empty()) {
                    result.status = TransferStatus::Completed;
                    return;
                }
                break;
            }

            default:
                throw ProtocolError(std::string("Unexpected ") + messageTypeName(SyncProtocol::typeOf(message)) +
                                    " during transfer");
        }
    }
}

bool TransferEngine::receiveBatch(const std::vector<ChunkId>& ids, Reassembler& reassembler, TransferResult& result) {
    BatchResultMessage reply;
    std::deque<std::pair<ChunkId, std::future<bool>>> pending;
    auto& metrics = MetricsCollector::instance();

    auto rejected = [&](const ChunkId& id, const std::string& why) {
        ++result.integrityFailures;
        metrics.incrementChunkIntegrityFailures();
        Logger::instance().warn("Chunk " + id.shortHex() + " " + why + ", requesting it again", "TransferEngine");
        reply.failed.push_back(id);
    };
    auto collect = [&]() {
        auto front = std::move(pending.front());
        pending.pop_front();
        if (front.second.get()) {
            reply.verified.push_back(front.first);
        } else {
            rejected(front.first, "does not match its id");
        }
    };

    try {
        for (const auto& id : ids) {
            if (cancelled_) {
                for (auto& entry : pending) {
                    entry.second.wait();
                }
                return false;
            }

            Frame frame = readFrame();
            auto plaintext = cipher_.tryOpen(frame, id);
            if (!plaintext) {
                // Not a chunk for this id: either a control message or damage in transit.
                auto control = cipher_.tryOpen(frame, ChunkId{});
                if (control) {
                    if (SyncProtocol::typeOf(*control) == MessageType::Abort) {
                        AbortMessage abort = SyncProtocol::decodeAbort(*control);
                        throw SessionAbortedError(abort.code, abort.reason);
                    }
                    throw ProtocolError(std::string("Unexpected ") + messageTypeName(SyncProtocol::typeOf(*control)) +
                                        " inside a batch");
                }
                rejected(id, "failed authentication");
                continue;
            }

            auto data = std::make_shared<std::vector<uint8_t>>(SyncProtocol::decodeChunk(std::move(*plaintext)));
            ++result.chunksReceived;
            result.bytesReceived += data->size();
            metrics.incrementChunksReceived();
            metrics.addBytesReceived(data->size());

            if (pending.size() >= options_.window) {
                collect();
            }
            pending.emplace_back(id, pool_.enqueue([&reassembler, id, data]() {
                if (Crypto::sha256(*data) != id) {
                    return false;
                }
                reassembler.writeChunk(id, *data);
                return true;
            }));
        }

        while (!pending.empty()) {
            collect();
        }
    } catch (const std::exception&) {
        for (auto& entry : pending) {
            entry.second.wait();
        }
        throw;
    }

    sendControl(SyncProtocol::encodeBatchResult(reply));
    return true;
}

} // namespace GlobalSend
