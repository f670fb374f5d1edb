//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SDK_SERVICE_DISCOVERY_HPP_INCLUDED
#define POSSYNC_SDK_SERVICE_DISCOVERY_HPP_INCLUDED

#include "lan_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace possync
{
namespace sdk
{

/// Local network service record, as advertised by a server and resolved by a browser.
///
struct ServiceRecord
{
    std::string                        service_type;
    std::string                        instance_name;
    std::string                        host;
    std::string                        ip_address;
    std::uint16_t                      port{0};
    std::map<std::string, std::string> properties;
};

/// Abstract interface of the local network service discovery (aka mDNS-style register & browse).
///
class ServiceDiscovery
{
public:
    using Ptr = std::shared_ptr<ServiceDiscovery>;

    /// Handle of an active service advertisement.
    ///
    /// Destruction of the handle unregisters the service.
    ///
    class Registration
    {
    public:
        using Ptr = std::unique_ptr<Registration>;

        Registration(Registration&&)                 = delete;
        Registration(const Registration&)            = delete;
        Registration& operator=(Registration&&)      = delete;
        Registration& operator=(const Registration&) = delete;

        virtual ~Registration() = default;

        /// Withdraws the advertisement. Idempotent.
        virtual void unregister() = 0;

        CETL_NODISCARD virtual bool isActive() const = 0;

    protected:
        Registration() = default;

    };  // Registration

    /// Finite lazy sequence of resolved service records.
    ///
    class Browser
    {
    public:
        using Ptr = std::unique_ptr<Browser>;

        Browser(Browser&&)                 = delete;
        Browser(const Browser&)            = delete;
        Browser& operator=(Browser&&)      = delete;
        Browser& operator=(const Browser&) = delete;

        virtual ~Browser() = default;

        /// Blocks until the next (not yet seen) record is resolved, or the browsing window is over.
        ///
        /// @return Empty optional when the window is over; any following call returns empty too.
        ///
        virtual cetl::optional<ServiceRecord> next() = 0;

        /// Starts the sequence over: re-sends the query, forgets already yielded records,
        /// and re-arms the browsing window.
        ///
        virtual void restart() = 0;

    protected:
        Browser() = default;

    };  // Browser

    struct RegisterResult
    {
        using Success = Registration::Ptr;
        using Failure = sdk::Failure;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct BrowseResult
    {
        using Success = Browser::Ptr;
        using Failure = sdk::Failure;
        using Var     = cetl::variant<Success, Failure>;
    };

    ServiceDiscovery(ServiceDiscovery&&)                 = delete;
    ServiceDiscovery(const ServiceDiscovery&)            = delete;
    ServiceDiscovery& operator=(ServiceDiscovery&&)      = delete;
    ServiceDiscovery& operator=(const ServiceDiscovery&) = delete;

    virtual ~ServiceDiscovery() = default;

    /// Starts advertising the given service.
    ///
    /// @return Registration handle, or failure if the advertising socket could not be set up.
    ///
    CETL_NODISCARD virtual RegisterResult::Var registerService(const ServiceRecord& record) = 0;

    /// Starts browsing for the services of the given type.
    ///
    /// A quiet network is not an error - the returned sequence is just empty.
    ///
    /// @return Browser of the resolved records, or failure if the browsing socket could not be set up.
    ///
    CETL_NODISCARD virtual BrowseResult::Var browse(const std::string&              service_type,
                                                    const std::chrono::milliseconds timeout) = 0;

protected:
    ServiceDiscovery() = default;

};  // ServiceDiscovery

}  // namespace sdk
}  // namespace possync

#endif  // POSSYNC_SDK_SERVICE_DISCOVERY_HPP_INCLUDED
