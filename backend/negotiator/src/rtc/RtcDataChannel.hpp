#pragma once
#include <memory>
#include <string>
#include <rtc/rtc.hpp>
#include "ITransport.hpp"
#include "../dispatcher/Dispatcher.hpp"

namespace negotiator::rtc {

class RtcDataChannel : public IDataChannel, public std::enable_shared_from_this<RtcDataChannel> {
public:
    RtcDataChannel(dispatch::Dispatcher& dispatcher, std::shared_ptr<::rtc::DataChannel> channel)
        : dispatcher_(dispatcher), channel_(std::move(channel)) {};

    static auto wrap(dispatch::Dispatcher& dispatcher, std::shared_ptr<::rtc::DataChannel> channel)
        -> std::shared_ptr<RtcDataChannel>;

    std::string label() const override { return channel_->label(); }
    bool isOpen() const override { return channel_->isOpen(); }
    void send(const std::string& data) override;
    void close() override;

private:
    dispatch::Dispatcher& dispatcher_;
    std::shared_ptr<::rtc::DataChannel> channel_;

    void setCallbacks();
};

}
