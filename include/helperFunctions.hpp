/*
 * Copyright (c) 2024-2025 Anthony J. Greenberg and Rebekah Rogers
 *
 * Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the copyright holder nor the names of its contributors may be used to endorse or promote products derived from this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER
 * IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF
 * THE POSSIBILITY OF SUCH DAMAGE.
 */

/// UMI molecule analyses helper functions
/** \file
 * \author Anthony J. Greenberg and Rebekah Rogers
 * \copyright Copyright (c) 2024 Anthony J. Greenberg and Rebekah Rogers
 * \version 0.2
 *
 * Definitions of class-external functions needed by UMI molecule analyses.
 *
 */

#pragma once

#include <string>
#include <utility> // for std::pair
#include <vector>
#include <unordered_map>

#include "sam.h"
#include "vcf.h"

#include "umiClassifier.hpp"

namespace umiSpace {
	/** \brief Split a UMI field into barcodes
	 *
	 * Splits at the first occurrence of the separator, or at the midpoint if the separator is empty.
	 * Returns an empty object if the separator is absent, the field has an odd length (midpoint split),
	 * or either barcode is empty.
	 *
	 * \param[in] umiField UMI string
	 * \param[in] separator barcode separator
	 * \return left and right barcodes
	 */
	[[gnu::warn_unused_result]] UMIpair splitUMIfield(const std::string &umiField, const std::string &separator);

	/** \brief Extract the UMI pair from a read
	 *
	 * The UMI field is either the last `readNameSeparator`-delimited field of the read name
	 * or the `RX` tag. Returns an empty object if the UMI cannot be parsed.
	 *
	 * \param[in] read aligned read
	 * \param[in] umiParameters UMI extraction parameters
	 * \return left and right barcodes
	 */
	[[gnu::warn_unused_result]] UMIpair extractUMIpair(const AlignedRead &read, const UMIparameters &umiParameters);

	/** \brief Make a molecule key
	 *
	 * Barcodes are swapped for reads from the reverse molecule strand,
	 * so that both strands of a molecule have the same key.
	 * The barcodes are joined with a tab.
	 *
	 * \param[in] umiPair UMI barcode pair
	 * \param[in] strand molecule strand of the read
	 * \return molecule key
	 */
	[[gnu::warn_unused_result]] std::string makeMoleculeKey(const UMIpair &umiPair, const MoleculeStrand &strand);

	/** \brief Test for a deamination substitution
	 *
	 * \param[in] referenceBase reference base
	 * \param[in] alternativeBase alternative base
	 * \return `true` if the substitution is C>T or G>A
	 */
	[[gnu::warn_unused_result]] bool isDeamination(const char &referenceBase, const char &alternativeBase) noexcept;

	/** \brief Classify a paired molecule
	 *
	 * Alternative alleles are tested first, in order. The first alternative with any support
	 * decides: support on both strands is a mutation, support on only one strand is an FFPE artifact.
	 * Failing that, reference support on both strands is a reference hit. Everything else is other.
	 * Alleles absent from the tallies are excluded and listed in the result.
	 *
	 * \param[in] forwardTally forward strand base tally
	 * \param[in] reverseTally reverse strand base tally
	 * \param[in] alleles queried alleles
	 * \return molecule classification
	 */
	[[gnu::warn_unused_result]] MoleculeClassification classifyMolecule(const BaseTally &forwardTally, const BaseTally &reverseTally, const AlleleSet &alleles);

	/** \brief Extract variant position and alleles
	 *
	 * \param[in] vcfHeader VCF header
	 * \param[in] vcfRecord unpacked VCF record
	 * \return variant site
	 */
	[[gnu::warn_unused_result]] VariantSite extractVariantSite(const bcf_hdr_t *vcfHeader, const bcf1_t *vcfRecord);

	/** \brief Is the variant a single-nucleotide substitution?
	 *
	 * Requires a one-base reference and a single one-base alternative, both `A`, `C`, `G`, or `T`.
	 *
	 * \param[in] variantSite variant site
	 * \return `true` if the variant can be classified
	 */
	[[gnu::warn_unused_result]] bool isSupportedVariant(const VariantSite &variantSite);

	/** \brief Annotate a variant with UMI molecule support
	 *
	 * Groups the reads into molecules, classifies them at the variant position, and sums the support.
	 * The FFPE filter is set if any paired molecule is an FFPE artifact and the substitution is within scope.
	 *
	 * \param[in] variantSite variant site
	 * \param[in] reads reads overlapping the variant
	 * \param[in] umiParameters UMI extraction parameters
	 * \param[in] ffpeScope substitutions eligible for an FFPE call
	 * \return variant annotation
	 */
	[[gnu::warn_unused_result]] VariantAnnotation annotateVariant(const VariantSite &variantSite, const std::vector<AlignedRead> &reads,
																	const UMIparameters &umiParameters, const FFPEscope &ffpeScope);

	/** \brief Convert an annotated variant to a CSV summary line
	 *
	 * \param[in] variantSite variant site
	 * \param[in] annotation variant annotation
	 * \param[in] separator field separator
	 * \return `std::string` with the summary, without a new line at the end
	 */
	[[gnu::warn_unused_result]] std::string stringifyVariantSupport(const VariantSite &variantSite, const VariantAnnotation &annotation, char separator = ',');

	/** \brief Command line parser
	 *
	 * Maps flags to values. Flags assumed to be of the form `--flag-name value`.
	 *
	 * \param[in] argc size of the `argv` array
	 * \param[in] argv command line input array
	 * \return map of tags to values
	 */
	[[gnu::warn_unused_result]] std::unordered_map<std::string, std::string> parseCL(int &argc, char **argv);

	/** \brief Extract parameters from parsed command line interface flags
	 *
	 * Extracts needed variable values, indexed by `std::string` encoded variable names.
	 *
	 * \param[in] parsedCLI flag values parsed from the command line
	 * \param[out] intVariables indexed `int` variables for use by `main()`
	 * \param[out] floatVariables indexed `float` variables for use by `main()`
	 * \param[out] stringVariables indexed `std::string` variables for use by `main()`
	 */
	void extractCLinfo(const std::unordered_map<std::string, std::string> &parsedCLI,
			std::unordered_map<std::string, int> &intVariables,
			std::unordered_map<std::string, float> &floatVariables,
			std::unordered_map<std::string, std::string> &stringVariables);

	/** \brief Build classification parameters from command line variables
	 *
	 * \param[in] intVariables indexed `int` variables
	 * \param[in] floatVariables indexed `float` variables
	 * \param[in] stringVariables indexed `std::string` variables
	 * \return classification parameters
	 */
	[[gnu::warn_unused_result]] ClassifierParameters makeClassifierParameters(const std::unordered_map<std::string, int> &intVariables,
			const std::unordered_map<std::string, float> &floatVariables,
			const std::unordered_map<std::string, std::string> &stringVariables);
}
