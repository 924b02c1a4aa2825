// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_CHROMAPRINT_DOMAIN_HXX
#define FPKIT_CHROMAPRINT_DOMAIN_HXX

class Domain;

extern const Domain chromaprint_domain;

#endif
