#pragma once

#include <gmock/gmock.h>
#include "chatvault/remote/memory_store.hpp"
#include "chatvault/remote/remote_store.hpp"

namespace chatvault::mocks {

// RemoteStore mock that forwards to an in-memory store unless a test overrides a call.
class MockRemoteStore : public remote::RemoteStore {
public:
    MOCK_METHOD(core::VaultResult, connect, (), (override));
    MOCK_METHOD(void, disconnect, (), (override));
    MOCK_METHOD(bool, is_connected, (), (const, override));
    MOCK_METHOD(bool, is_authorized, (), (const, override));
    MOCK_METHOD(core::VaultResult, authorize, (const std::string&, std::string&), (override));
    MOCK_METHOD(core::VaultResult, create_channel, (const std::string&, remote::ChannelId&), (override));
    MOCK_METHOD(core::VaultResult, open_channel, (remote::ChannelId), (override));
    MOCK_METHOD(core::VaultResult, send_text, (remote::ChannelId, const std::string&, remote::MessageRef&), (override));
    MOCK_METHOD(core::VaultResult, edit_text, (remote::ChannelId, remote::MessageRef, const std::string&), (override));
    MOCK_METHOD(core::VaultResult, get_message, (remote::ChannelId, remote::MessageRef, remote::StoredMessage&), (override));
    MOCK_METHOD(core::VaultResult, send_blob,
                (remote::ChannelId, std::span<const uint8_t>, const std::string&,
                 std::optional<remote::MessageRef>, remote::MessageRef&),
                (override));
    MOCK_METHOD(core::VaultResult, get_blob, (remote::ChannelId, remote::MessageRef, std::vector<uint8_t>&), (override));
    MOCK_METHOD(core::VaultResult, list_messages,
                (remote::ChannelId, const remote::MessageFilter&, std::vector<remote::StoredMessage>&),
                (override));
    MOCK_METHOD(core::VaultResult, pin, (remote::ChannelId, remote::MessageRef), (override));
    MOCK_METHOD(core::VaultResult, delete_messages, (remote::ChannelId, const std::vector<remote::MessageRef>&), (override));

    void delegate_to_fake() {
        using ::testing::Invoke;
        ON_CALL(*this, connect).WillByDefault(Invoke(&fake_, &remote::MemoryStore::connect));
        ON_CALL(*this, disconnect).WillByDefault(Invoke(&fake_, &remote::MemoryStore::disconnect));
        ON_CALL(*this, is_connected).WillByDefault(Invoke(&fake_, &remote::MemoryStore::is_connected));
        ON_CALL(*this, is_authorized).WillByDefault(Invoke(&fake_, &remote::MemoryStore::is_authorized));
        ON_CALL(*this, authorize).WillByDefault(Invoke(&fake_, &remote::MemoryStore::authorize));
        ON_CALL(*this, create_channel).WillByDefault(Invoke(&fake_, &remote::MemoryStore::create_channel));
        ON_CALL(*this, open_channel).WillByDefault(Invoke(&fake_, &remote::MemoryStore::open_channel));
        ON_CALL(*this, send_text).WillByDefault(Invoke(&fake_, &remote::MemoryStore::send_text));
        ON_CALL(*this, edit_text).WillByDefault(Invoke(&fake_, &remote::MemoryStore::edit_text));
        ON_CALL(*this, get_message).WillByDefault(Invoke(&fake_, &remote::MemoryStore::get_message));
        ON_CALL(*this, send_blob).WillByDefault(Invoke(&fake_, &remote::MemoryStore::send_blob));
        ON_CALL(*this, get_blob).WillByDefault(Invoke(&fake_, &remote::MemoryStore::get_blob));
        ON_CALL(*this, list_messages).WillByDefault(Invoke(&fake_, &remote::MemoryStore::list_messages));
        ON_CALL(*this, pin).WillByDefault(Invoke(&fake_, &remote::MemoryStore::pin));
        ON_CALL(*this, delete_messages).WillByDefault(Invoke(&fake_, &remote::MemoryStore::delete_messages));
    }

    remote::MemoryStore& fake() { return fake_; }

private:
    remote::MemoryStore fake_;
};

}
