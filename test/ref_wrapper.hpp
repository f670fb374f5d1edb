//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_REF_WRAPPER_HPP_INCLUDED
#define POSSYNC_REF_WRAPPER_HPP_INCLUDED

namespace possync
{

/// Owning (f.e. by `std::unique_ptr`) facade of a mock which is owned by the test itself.
///
/// Destruction of the facade is reported to the mock as `deinit()` call.
///
template <typename Interface, typename Reference>
struct RefWrapper : Interface
{
    explicit RefWrapper(Reference& reference)
        : reference_{reference}
    {
    }

    RefWrapper(const RefWrapper& other)          = delete;
    RefWrapper(RefWrapper&&) noexcept            = delete;
    RefWrapper& operator=(const RefWrapper&)     = delete;
    RefWrapper& operator=(RefWrapper&&) noexcept = delete;

    ~RefWrapper() override
    {
        reference_.deinit();
    }

    Reference& reference() const
    {
        return reference_;
    }

private:
    Reference& reference_;

};  // RefWrapper

}  // namespace possync

#endif  // POSSYNC_REF_WRAPPER_HPP_INCLUDED
