// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

namespace commparity {

// Returns a TCP port that was unbound on the local host at the time of the
// call. Binds an IPv4 wildcard socket to port 0, falling back to IPv6, and
// releases it before returning; another process may grab the port before the
// caller binds it. Throws ResourceUnavailableError if neither family works.
int getOpenPort();

} // namespace commparity
