#include "RtcDataChannel.hpp"

#include <exception>
#include <variant>
#include <plog/Log.h>

using namespace negotiator::rtc;

auto RtcDataChannel::wrap(dispatch::Dispatcher& dispatcher, std::shared_ptr<::rtc::DataChannel> channel)
    -> std::shared_ptr<RtcDataChannel> {
    auto wrapper = std::make_shared<RtcDataChannel>(dispatcher, std::move(channel));
    wrapper->setCallbacks();
    return wrapper;
}

void RtcDataChannel::setCallbacks() {
    auto weakSelf = weak_from_this();
    // libdatachannel may still call back after this wrapper is gone.
    auto post = [weakSelf, &dispatcher = dispatcher_](auto fn) {
        dispatcher.post([weakSelf, fn = std::move(fn)]() {
            if (auto self = weakSelf.lock())
                fn(*self);
        });
    };

    channel_->onOpen([post]() {
        post([](RtcDataChannel& self) {
            if (self.onOpen) self.onOpen();
        });
    });

    channel_->onClosed([post]() {
        post([](RtcDataChannel& self) {
            if (self.onClose) self.onClose();
        });
    });

    channel_->onError([post](std::string error) {
        post([error = std::move(error)](RtcDataChannel& self) {
            if (self.onError) self.onError(error);
        });
    });

    channel_->onBufferedAmountLow([post]() {
        post([](RtcDataChannel& self) {
            if (self.onBufferedAmountLow) self.onBufferedAmountLow();
        });
    });

    channel_->onMessage([post](::rtc::message_variant message) {
        std::string payload;
        if (auto* text = std::get_if<std::string>(&message)) {
            payload = std::move(*text);
        } else {
            const auto& bytes = std::get<::rtc::binary>(message);
            payload.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }
        post([payload = std::move(payload)](RtcDataChannel& self) {
            if (self.onMessage) self.onMessage(payload);
        });
    });
}

void RtcDataChannel::send(const std::string& data) {
    try {
        channel_->send(data);
    } catch (const std::exception& ex) {
        PLOG_WARNING << "Data channel " << channel_->label() << " send failed: " << ex.what();
    }
}

void RtcDataChannel::close() {
    channel_->close();
}
