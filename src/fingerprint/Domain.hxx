// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FINGERPRINT_DOMAIN_HXX
#define FPKIT_FINGERPRINT_DOMAIN_HXX

class Domain;

extern const Domain fingerprint_domain;

#endif
