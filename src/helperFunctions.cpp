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
 * Implementation of class-external functions needed by UMI molecule analyses.
 *
 */

#include <cctype>
#include <algorithm>
#include <array>
#include <iterator>
#include <numeric>
#include <string>
#include <sstream>
#include <iomanip>
#include <thread>
#include <utility>

#include "sam.h"
#include "vcf.h"

#include "helperFunctions.hpp"
#include "umiClassifier.hpp"

using namespace umiSpace;

UMIpair umiSpace::splitUMIfield(const std::string &umiField, const std::string &separator) {
	UMIpair result;
	if ( separator.empty() ) {
		if ( umiField.empty() || (umiField.size() % 2 != 0) ) {
			return result;
		}
		const size_t midpoint = umiField.size() / 2;
		result.left  = umiField.substr(0, midpoint);
		result.right = umiField.substr(midpoint);
		return result;
	}
	const size_t separatorPosition = umiField.find(separator);
	if (separatorPosition == std::string::npos) {
		return result;
	}
	const size_t rightStart = separatorPosition + separator.size();
	// anything after a second separator is ignored
	const size_t rightEnd   = umiField.find(separator, rightStart);
	std::string left{umiField.substr(0, separatorPosition)};
	std::string right{ umiField.substr(rightStart, rightEnd == std::string::npos ? std::string::npos : rightEnd - rightStart) };
	if ( left.empty() || right.empty() ) {
		return result;
	}
	result.left  = std::move(left);
	result.right = std::move(right);
	return result;
}

UMIpair umiSpace::extractUMIpair(const AlignedRead &read, const UMIparameters &umiParameters) {
	if (umiParameters.source == UMIsource::RX_TAG) {
		return splitUMIfield(read.getUMItag(), umiParameters.umiSeparator);
	}
	const std::string readName{read.getReadName()};
	const size_t fieldStart = readName.rfind(umiParameters.readNameSeparator);
	if (fieldStart == std::string::npos) {
		return UMIpair{};
	}
	return splitUMIfield(readName.substr(fieldStart + 1), umiParameters.umiSeparator);
}

std::string umiSpace::makeMoleculeKey(const UMIpair &umiPair, const MoleculeStrand &strand) {
	// tabs cannot occur in read names or Z-type tags
	constexpr char keyJoiner{'\t'};
	if (strand == MoleculeStrand::FORWARD) {
		return umiPair.left + keyJoiner + umiPair.right;
	}
	return umiPair.right + keyJoiner + umiPair.left;
}

bool umiSpace::isDeamination(const char &referenceBase, const char &alternativeBase) noexcept {
	return ( (referenceBase == 'C') && (alternativeBase == 'T') ) || ( (referenceBase == 'G') && (alternativeBase == 'A') );
}

MoleculeClassification umiSpace::classifyMolecule(const BaseTally &forwardTally, const BaseTally &reverseTally, const AlleleSet &alleles) {
	MoleculeClassification result;
	result.forwardTally = forwardTally;
	result.reverseTally = reverseTally;

	std::string queriedAlternatives;
	for (const auto &eachAllele : alleles.alternative + alleles.reference) {
		if ( forwardTally.tracks(eachAllele) ) {
			continue;
		}
		if (result.excludedAlleles.find(eachAllele) == std::string::npos) {
			result.excludedAlleles.push_back(eachAllele);
		}
	}
	std::copy_if(
		alleles.alternative.cbegin(),
		alleles.alternative.cend(),
		std::back_inserter(queriedAlternatives),
		[&forwardTally](const char &eachAllele) { return forwardTally.tracks(eachAllele); }
	);

	// the first alternative seen on either strand decides the category
	for (const auto &eachAlternative : queriedAlternatives) {
		const bool onForward = forwardTally.count(eachAlternative) > 0;
		const bool onReverse = reverseTally.count(eachAlternative) > 0;
		if (onForward && onReverse) {
			result.category = MoleculeCategory::MUTATION;
			return result;
		}
		if (onForward || onReverse) {
			result.category = MoleculeCategory::FFPE;
			return result;
		}
	}
	for (const auto &eachReference : alleles.reference) {
		if ( !forwardTally.tracks(eachReference) ) {
			continue;
		}
		if ( (forwardTally.count(eachReference) > 0) && (reverseTally.count(eachReference) > 0) ) {
			result.category = MoleculeCategory::REFERENCE;
			return result;
		}
	}
	result.category = MoleculeCategory::OTHER;
	return result;
}

VariantSite umiSpace::extractVariantSite(const bcf_hdr_t *vcfHeader, const bcf1_t *vcfRecord) {
	if ( (vcfHeader == nullptr) || (vcfRecord == nullptr) ) {
		throw std::string("ERROR: null VCF header or record pointer in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	VariantSite result;
	result.chromosome = std::string{bcf_hdr_id2name(vcfHeader, vcfRecord->rid)};
	result.position   = vcfRecord->pos + 1;
	if (vcfRecord->n_allele > 0) {
		result.reference = std::string{vcfRecord->d.allele[0]};
	}
	for (uint32_t iAllele = 1; iAllele < vcfRecord->n_allele; ++iAllele) {
		result.alternatives.emplace_back(vcfRecord->d.allele[iAllele]);
	}
	return result;
}

bool umiSpace::isSupportedVariant(const VariantSite &variantSite) {
	const std::string nucleotides{"ACGT"};
	auto isNucleotide = [&nucleotides](const std::string &allele) {
		return (allele.size() == 1) &&
			(nucleotides.find( static_cast<char>( std::toupper( static_cast<unsigned char>( allele.front() ) ) ) ) != std::string::npos);
	};
	return isNucleotide(variantSite.reference) && (variantSite.alternatives.size() == 1) && isNucleotide( variantSite.alternatives.front() );
}

VariantAnnotation umiSpace::annotateVariant(const VariantSite &variantSite, const std::vector<AlignedRead> &reads,
											const UMIparameters &umiParameters, const FFPEscope &ffpeScope) {
	VariantAnnotation result;
	if ( !isSupportedVariant(variantSite) ) {
		result.status = VariantStatus::UNSUPPORTED_SHAPE;
		return result;
	}
	auto toUpper = [](const char &base) { return static_cast<char>( std::toupper( static_cast<unsigned char>(base) ) ); };
	AlleleSet alleles;
	alleles.reference.push_back( toUpper( variantSite.reference.front() ) );
	alleles.alternative.push_back( toUpper( variantSite.alternatives.front().front() ) );

	const MoleculeGroups moleculeGroups(reads, umiParameters);
	const std::vector<std::string> unparseableReads{moleculeGroups.unparseableReads()};
	if ( !unparseableReads.empty() ) {
		result.warnings.emplace_back(
			std::to_string( unparseableReads.size() ) + " reads with unparseable UMIs skipped (e.g., " + unparseableReads.front() + ")"
		);
	}
	result.support = PositionSupport(moleculeGroups.tallyBases(variantSite.position - 1), alleles);
	result.ffpeFiltered = result.support.hasFFPEartifact() &&
		( (ffpeScope == FFPEscope::ALL) || isDeamination( alleles.reference.front(), alleles.alternative.front() ) );
	if ( !result.support.excludedAlleles().empty() ) {
		result.warnings.emplace_back("alleles excluded from classification: " + result.support.excludedAlleles());
	}
	result.status = VariantStatus::ANNOTATED;
	return result;
}

std::string umiSpace::stringifyVariantSupport(const VariantSite &variantSite, const VariantAnnotation &annotation, char separator) {
	const PositionSupport &support = annotation.support;
	const AlleleSet alleles{support.getAlleles()};
	auto sumSupport = [&support](const std::string &alleleSymbols) {
		return std::accumulate(
			alleleSymbols.cbegin(),
			alleleSymbols.cend(),
			0U,
			[&support](uint32_t sum, const char &allele) {
				const AlleleSupport alleleSupport{support.getSupport(allele)};
				return sum + alleleSupport.paired + alleleSupport.forwardSingle + alleleSupport.reverseSingle;
			}
		);
	};
	std::string alternatives;
	for (const auto &eachAlternative : variantSite.alternatives) {
		if ( !alternatives.empty() ) {
			alternatives.push_back('/');
		}
		alternatives += eachAlternative;
	}
	std::stringstream outStream;
	outStream << variantSite.chromosome << separator
		<< variantSite.position << separator
		<< variantSite.reference << separator
		<< alternatives << separator
		<< alleles.reference << ">" << alleles.alternative << separator
		<< sumSupport(alleles.reference) << separator
		<< sumSupport(alleles.alternative) << separator
		<< support.nMolecules(MoleculeCategory::FFPE) << separator
		<< support.nPairedMolecules() << separator
		<< std::fixed << std::setprecision(2) << support.ffpePercent() << separator
		<< (annotation.ffpeFiltered ? "FFPE" : ".");
	return outStream.str();
}

std::unordered_map<std::string, std::string> umiSpace::parseCL(int &argc, char **argv) {
	std::unordered_map<std::string, std::string> cliResult;
	// set to true after encountering a flag token (the characters after the dash)
	bool val = false;
	// store the token value here
	std::string curFlag;

	for (int iArg = 1; iArg < argc; iArg++) {
		const char *pchar = argv[iArg];
		if ( (pchar[0] == '-') && (pchar[1] == '-') ) { // encountered the double dash, look for the token after it
			if (val) { // A previous flag had no value
				cliResult[curFlag] = "set";
			}
			// what follows the dash?
			val     = true;
			curFlag = pchar + 2;
			continue;
		}
		if (val) {
			val                = false;
			cliResult[curFlag] = pchar;
		}
	}
	if (val) { // the last flag had no value
		cliResult[curFlag] = "set";
	}
	return cliResult;
}

void umiSpace::extractCLinfo(const std::unordered_map<std::string, std::string> &parsedCLI,
		std::unordered_map<std::string, int> &intVariables,
		std::unordered_map<std::string, float> &floatVariables,
		std::unordered_map<std::string, std::string> &stringVariables) {
	intVariables.clear();
	floatVariables.clear();
	stringVariables.clear();
	const std::array<std::string, 3> requiredStringVariables{"input-bam", "input-vcf", "out"};
	const std::array<std::string, 5> optionalStringVariables{
		"ffpe-nucleotides", "umi-position", "qrn-split-character", "umi-split-character", "out-csv"
	};
	const std::array<std::string, 2> optionalIntVariables{"threads", "queue-size"};
	const std::array<std::string, 2> optionalFloatVariables{"vaf-min", "vaf-max"};

	const std::unordered_map<std::string, int> defaultIntValues{ {"threads", -1}, {"queue-size", 0} };
	const std::unordered_map<std::string, float> defaultFloatValues{ {"vaf-min", 0.0F}, {"vaf-max", 100.0F} };
	const std::unordered_map<std::string, std::string> defaultStringValues{
		{"ffpe-nucleotides",    "standard"},
		{"umi-position",        "qrn"},
		{"qrn-split-character", "_"},
		{"umi-split-character", "+"},
		{"out-csv",             "NULL"}
	};

	if ( parsedCLI.empty() ) {
		throw std::string("No command line flags specified;");
	}
	for (const auto &eachFlag : optionalIntVariables) {
		try {
			intVariables[eachFlag] = stoi( parsedCLI.at(eachFlag) );
		} catch(const std::exception &problem) {
			intVariables[eachFlag] = defaultIntValues.at(eachFlag);
		}
	}
	for (const auto &eachFlag : optionalFloatVariables) {
		try {
			floatVariables[eachFlag] = stof( parsedCLI.at(eachFlag) );
		} catch(const std::exception &problem) {
			floatVariables[eachFlag] = defaultFloatValues.at(eachFlag);
		}
	}
	for (const auto &eachFlag : requiredStringVariables) {
		try {
			stringVariables[eachFlag] = parsedCLI.at(eachFlag);
		} catch(const std::exception &problem) {
			throw std::string("ERROR: ") + eachFlag + std::string(" specification is required");
		}
	}
	for (const auto &eachFlag : optionalStringVariables) {
		try {
			stringVariables[eachFlag] = parsedCLI.at(eachFlag);
		} catch(const std::exception &problem) {
			stringVariables[eachFlag] = defaultStringValues.at(eachFlag);
		}
	}
	// RX tags have no barcode separator by default
	if ( (stringVariables.at("umi-position") == "rx") && (parsedCLI.find("umi-split-character") == parsedCLI.cend()) ) {
		stringVariables["umi-split-character"] = "half";
	}

	const std::string &ffpeNucleotides = stringVariables.at("ffpe-nucleotides");
	if ( (ffpeNucleotides != "standard") && (ffpeNucleotides != "all") ) {
		throw std::string("ERROR: --ffpe-nucleotides must be standard or all, got ") + ffpeNucleotides;
	}
	const std::string &umiPosition = stringVariables.at("umi-position");
	if ( (umiPosition != "qrn") && (umiPosition != "rx") ) {
		throw std::string("ERROR: --umi-position must be qrn or rx, got ") + umiPosition;
	}
	if (stringVariables.at("qrn-split-character").size() != 1) {
		throw std::string("ERROR: --qrn-split-character must be a single character");
	}
	if ( floatVariables.at("vaf-min") > floatVariables.at("vaf-max") ) {
		throw std::string("ERROR: --vaf-min must not exceed --vaf-max");
	}
}

ClassifierParameters umiSpace::makeClassifierParameters(const std::unordered_map<std::string, int> &intVariables,
		const std::unordered_map<std::string, float> &floatVariables,
		const std::unordered_map<std::string, std::string> &stringVariables) {
	ClassifierParameters parameters;
	parameters.umiParameters.source = (stringVariables.at("umi-position") == "rx") ? UMIsource::RX_TAG : UMIsource::READ_NAME;
	parameters.umiParameters.readNameSeparator = stringVariables.at("qrn-split-character").front();
	const std::string &umiSplit = stringVariables.at("umi-split-character");
	parameters.umiParameters.umiSeparator = (umiSplit == "half") ? std::string() : umiSplit;
	parameters.ffpeScope = (stringVariables.at("ffpe-nucleotides") == "all") ? FFPEscope::ALL : FFPEscope::DEAMINATION;

	const size_t maxThreads{std::thread::hardware_concurrency()};
	const int requestedThreads{intVariables.at("threads")};
	parameters.nThreads = (requestedThreads < 1) ? maxThreads : std::min(static_cast<size_t>(requestedThreads), maxThreads);
	parameters.nThreads = std::max(parameters.nThreads, 1UL);
	parameters.queueCapacity = static_cast<size_t>( std::max(intVariables.at("queue-size"), 0) );

	parameters.csvFileName     = stringVariables.at("out-csv");
	parameters.vafPercentRange = std::make_pair( floatVariables.at("vaf-min"), floatVariables.at("vaf-max") );
	return parameters;
}
