#pragma once

#include <functional>
#include <memory>
#include <string>
#include "channel.hpp"

enum class RegistrationResult {
	OK,
	IDENTITY_TAKEN,
	FAILED
};

/**
 * Rendezvous maps a human-readable code to a reachable peer.
 * A host registers a code and receives incoming channels through the
 * handler; a guest connects to a code and gets its end of a new channel.
 * Channels are handed out unopened so the caller can install handlers first.
 */
class Rendezvous {
public:
	using IncomingHandler = std::function<void(std::shared_ptr<Channel>)>;

	virtual ~Rendezvous() = default;

	virtual RegistrationResult registerIdentity(const std::string& code, IncomingHandler on_incoming) = 0;

	/**
	 * After this returns the incoming handler for code is never called again
	 */
	virtual void unregisterIdentity(const std::string& code) = 0;

	/**
	 * Returns nullptr when nobody is registered under code
	 */
	virtual std::shared_ptr<Channel> connect(const std::string& code, const std::string& local_id) = 0;
};
