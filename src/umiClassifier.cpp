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

/// Reconstruct UMI molecules and classify FFPE artifacts
/** \file
 * \author Anthony J. Greenberg and Rebekah Rogers
 * \copyright Copyright (c) 2024 Anthony J. Greenberg and Rebekah Rogers
 * \version 0.1
 *
 * Implementation of classes that group `.bam` reads into UMI-tagged double-stranded molecules
 * and classify single-nucleotide variant calls as true mutations or FFPE deamination artifacts.
 *
 */

#include <cctype>
#include <algorithm>
#include <iterator>
#include <numeric>
#include <memory>
#include <utility>
#include <vector>
#include <array>
#include <map>
#include <string>
#include <fstream>
#include <future>
#include <thread>

#include "hts.h"
#include "sam.h"
#include "vcf.h"

#include "umiClassifier.hpp"
#include "helperFunctions.hpp"
#include "boundedQueue.hpp"

using namespace umiSpace;

namespace {
	/** \brief Variant record waiting for classification */
	struct VariantTask {
		/** \brief Record index in the input file */
		uint64_t index{0};
		/** \brief Unpacked variant record */
		std::unique_ptr<bcf1_t, BCFrecordDeleter> record;
	};
	/** \brief Classified variant record waiting to be saved */
	struct AnnotatedRecord {
		/** \brief Record index in the input file */
		uint64_t index{0};
		/** \brief Variant record, annotated if classification succeeded */
		std::unique_ptr<bcf1_t, BCFrecordDeleter> record;
		/** \brief Variant position and alleles */
		VariantSite site;
		/** \brief Classification results */
		VariantAnnotation annotation;
	};
}

// AlignedRead methods
constexpr std::array<hts_pos_t, 10> AlignedRead::queryConsumption_{
	1, 1, 0, 0, 1,
	0, 0, 1, 1, 0
};
constexpr std::array<hts_pos_t, 10> AlignedRead::referenceConsumption_{
	1, 0, 1, 1, 0,
	0, 0, 1, 1, 0
};

AlignedRead::AlignedRead(const bam1_t *alignmentRecord) :
			isFirstMate_{ (alignmentRecord->core.flag & BAM_FREAD2) == 0 }, isRev_{bam_is_rev(alignmentRecord)} { // unpaired reads count as first mates
	readName_ = std::string{bam_get_qname(alignmentRecord)};
	const uint8_t *const sequence = bam_get_seq(alignmentRecord);
	for (int32_t iSeq = 0; iSeq < alignmentRecord->core.l_qseq; ++iSeq) {
		sequence_.push_back( seq_nt16_str[bam_seqi(sequence, iSeq)] );
	}
	const uint8_t *const rxData = bam_aux_get(alignmentRecord, "RX");
	if (rxData != nullptr) {
		const char *const rxValue = bam_aux2Z(rxData);
		if (rxValue != nullptr) {
			umiTag_ = std::string{rxValue};
		}
	}

	// soft clips and insertions occupy read positions but have no reference position
	hts_pos_t referencePosition{alignmentRecord->core.pos};
	const uint32_t *const cigar = bam_get_cigar(alignmentRecord);
	for (uint32_t iCIGAR = 0; iCIGAR < alignmentRecord->core.n_cigar; ++iCIGAR) {
		const uint32_t cigarOperation = bam_cigar_op(cigar[iCIGAR]);
		const auto cigarLength        = static_cast<hts_pos_t>( bam_cigar_oplen(cigar[iCIGAR]) );
		const bool consumesReference  = ( referenceConsumption_.at(cigarOperation) == 1 );
		if (queryConsumption_.at(cigarOperation) == 1) {
			for (hts_pos_t iBase = 0; iBase < cigarLength; ++iBase) {
				referencePositions_.push_back(consumesReference ? referencePosition + iBase : -1);
			}
		}
		referencePosition += cigarLength * referenceConsumption_.at(cigarOperation);
	}
	referencePositions_.resize(sequence_.size(), -1);
}

MoleculeStrand AlignedRead::getMoleculeStrand() const noexcept {
	return (isFirstMate_ != isRev_) ? MoleculeStrand::FORWARD : MoleculeStrand::REVERSE;
}

char AlignedRead::getBaseAt(const hts_pos_t &referencePosition) const {
	if (referencePosition < 0) {
		return gapSymbol;
	}
	const auto positionIt = std::find(referencePositions_.cbegin(), referencePositions_.cend(), referencePosition);
	if ( positionIt == referencePositions_.cend() ) {
		return gapSymbol;
	}
	const auto baseIdx = static_cast<size_t>( std::distance(referencePositions_.cbegin(), positionIt) );
	const auto base    = static_cast<char>( std::toupper( static_cast<unsigned char>( sequence_.at(baseIdx) ) ) );
	if ( (base == 'A') || (base == 'C') || (base == 'G') || (base == 'T') ) {
		return base;
	}
	return unknownBase;
}

// BaseTally methods
constexpr std::array<char, 6> BaseTally::symbols_{'A', 'T', 'G', 'C', unknownBase, gapSymbol};

void BaseTally::addBase(const char &base) noexcept {
	size_t symbolIdx = symbolIndex_( static_cast<char>( std::toupper( static_cast<unsigned char>(base) ) ) );
	if ( symbolIdx == symbols_.size() ) {
		symbolIdx = symbolIndex_(unknownBase);
	}
	++counts_[symbolIdx];
}

bool BaseTally::tracks(const char &symbol) const noexcept {
	return symbolIndex_(symbol) < symbols_.size();
}

uint32_t BaseTally::count(const char &symbol) const {
	const size_t symbolIdx = symbolIndex_(symbol);
	if ( symbolIdx == symbols_.size() ) {
		throw std::string("ERROR: symbol '") + symbol + std::string("' is not counted in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	return counts_.at(symbolIdx);
}

uint32_t BaseTally::total() const noexcept {
	return std::accumulate(counts_.cbegin(), counts_.cend(), 0U);
}

size_t BaseTally::symbolIndex_(const char &symbol) noexcept {
	return static_cast<size_t>( std::distance( symbols_.cbegin(), std::find(symbols_.cbegin(), symbols_.cend(), symbol) ) );
}

// MoleculeGroups methods
MoleculeGroups::MoleculeGroups(const std::vector<AlignedRead> &reads, const UMIparameters &umiParameters) {
	for (const auto &eachRead : reads) {
		const UMIpair umiPair{extractUMIpair(eachRead, umiParameters)};
		if ( umiPair.left.empty() ) {
			unparseableReads_.emplace_back( eachRead.getReadName() );
			continue;
		}
		const MoleculeStrand readStrand{eachRead.getMoleculeStrand()};
		MoleculeGroup &currentGroup = groups_[makeMoleculeKey(umiPair, readStrand)];
		if (readStrand == MoleculeStrand::FORWARD) {
			currentGroup.forwardReads.push_back(&eachRead);
			continue;
		}
		currentGroup.reverseReads.push_back(&eachRead);
	}
}

size_t MoleculeGroups::nPairedMolecules() const noexcept {
	return static_cast<size_t>(
		std::count_if(
			groups_.cbegin(),
			groups_.cend(),
			[](const std::pair<const std::string, MoleculeGroup> &eachGroup) {
				return !eachGroup.second.forwardReads.empty() && !eachGroup.second.reverseReads.empty();
			}
		)
	);
}

std::vector<MoleculeTallies> MoleculeGroups::tallyBases(const hts_pos_t &referencePosition) const {
	std::vector<MoleculeTallies> result;
	result.reserve( groups_.size() );
	for (const auto &eachGroup : groups_) {
		MoleculeTallies currentTallies;
		currentTallies.moleculeKey = eachGroup.first;
		for (const auto *eachRead : eachGroup.second.forwardReads) {
			currentTallies.forwardTally.addBase( eachRead->getBaseAt(referencePosition) );
		}
		for (const auto *eachRead : eachGroup.second.reverseReads) {
			currentTallies.reverseTally.addBase( eachRead->getBaseAt(referencePosition) );
		}
		result.emplace_back( std::move(currentTallies) );
	}
	return result;
}

// PositionSupport methods
PositionSupport::PositionSupport(const std::vector<MoleculeTallies> &moleculeTallies, AlleleSet alleles) :
																									alleles_{std::move(alleles)} {
	for (const auto &eachAllele : alleles_.alternative + alleles_.reference) {
		support_[eachAllele] = AlleleSupport{};
	}
	auto noteExcluded = [this](const char &allele) {
		if (excludedAlleles_.find(allele) == std::string::npos) {
			excludedAlleles_.push_back(allele);
		}
	};
	for (const auto &eachMolecule : moleculeTallies) {
		const bool hasForward = eachMolecule.forwardTally.total() > 0;
		const bool hasReverse = eachMolecule.reverseTally.total() > 0;
		if (hasForward && hasReverse) {
			const MoleculeClassification classification{classifyMolecule(eachMolecule.forwardTally, eachMolecule.reverseTally, alleles_)};
			++categoryCounts_.at( static_cast<size_t>(classification.category) );
			std::for_each(classification.excludedAlleles.cbegin(), classification.excludedAlleles.cend(), noteExcluded);
			// every paired molecule adds both strand counts, whatever its category
			for (auto &eachSupport : support_) {
				if ( eachMolecule.forwardTally.tracks(eachSupport.first) ) {
					eachSupport.second.paired += eachMolecule.forwardTally.count(eachSupport.first) + eachMolecule.reverseTally.count(eachSupport.first);
				}
			}
			continue;
		}
		if (hasForward) {
			++nForwardSingletons_;
			for (auto &eachSupport : support_) {
				if ( eachMolecule.forwardTally.tracks(eachSupport.first) ) {
					eachSupport.second.forwardSingle += eachMolecule.forwardTally.count(eachSupport.first);
					continue;
				}
				noteExcluded(eachSupport.first);
			}
			continue;
		}
		if (hasReverse) {
			++nReverseSingletons_;
			for (auto &eachSupport : support_) {
				if ( eachMolecule.reverseTally.tracks(eachSupport.first) ) {
					eachSupport.second.reverseSingle += eachMolecule.reverseTally.count(eachSupport.first);
					continue;
				}
				noteExcluded(eachSupport.first);
			}
		}
	}
}

AlleleSupport PositionSupport::getSupport(const char &allele) const {
	const auto supportIt = support_.find(allele);
	if ( supportIt == support_.cend() ) {
		throw std::string("ERROR: allele '") + allele + std::string("' was not queried in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	return supportIt->second;
}

uint32_t PositionSupport::nMolecules(const MoleculeCategory &category) const noexcept {
	return categoryCounts_[static_cast<size_t>(category)];
}

uint32_t PositionSupport::nPairedMolecules() const noexcept {
	return std::accumulate(categoryCounts_.cbegin(), categoryCounts_.cend(), 0U);
}

float PositionSupport::ffpePercent() const noexcept {
	const uint32_t nPaired{nPairedMolecules()};
	if (nPaired == 0) {
		return 0.0F;
	}
	return 100.0F * static_cast<float>( nMolecules(MoleculeCategory::FFPE) ) / static_cast<float>(nPaired);
}

std::string PositionSupport::umiField() const {
	return stringifySupport_(alleles_.alternative) + ";" + stringifySupport_(alleles_.reference);
}

std::string PositionSupport::moleculeSummaryField() const {
	std::string result = std::accumulate(
		categoryCounts_.cbegin(),
		categoryCounts_.cend(),
		std::string(),
		[](std::string strVal, uint32_t count) {
			return std::move(strVal) + std::to_string(count) + ':';
		}
	);
	result += std::to_string(nForwardSingletons_) + ":" + std::to_string(nReverseSingletons_);
	return result;
}

std::string PositionSupport::stringifySupport_(const std::string &alleleSymbols) const {
	std::string result;
	for (const auto &eachAllele : alleleSymbols) {
		const AlleleSupport currentSupport{support_.at(eachAllele)};
		if ( !result.empty() ) {
			result.push_back(',');
		}
		result += std::to_string(currentSupport.paired) + ":"
				+ std::to_string(currentSupport.forwardSingle) + ":"
				+ std::to_string(currentSupport.reverseSingle);
	}
	return result;
}

// BAMfile methods
constexpr uint16_t BAMfile::skipFlags_{BAM_FUNMAP | BAM_FSECONDARY | BAM_FSUPPLEMENTARY};

BAMfile::BAMfile(const std::string &bamFileName) : bamFileName_{bamFileName}, bamFile_{ sam_open(bamFileName.c_str(), "r") } {
	if (bamFile_ == nullptr) {
		throw std::string("ERROR: failed to open the BAM file ")
			+ bamFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	bamHeader_.reset( sam_hdr_read( bamFile_.get() ) );
	if (bamHeader_ == nullptr) {
		throw std::string("ERROR: failed to read the header from the BAM file ")
			+ bamFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	bamIndex_.reset( sam_index_load( bamFile_.get(), bamFileName.c_str() ) );
	if (bamIndex_ == nullptr) {
		throw std::string("ERROR: failed to load the index for the BAM file ")
			+ bamFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
}

bool BAMfile::hasReference(const std::string &referenceName) const {
	if (bamHeader_ == nullptr) {
		return false;
	}
	return sam_hdr_name2tid( bamHeader_.get(), referenceName.c_str() ) >= 0;
}

std::vector<AlignedRead> BAMfile::fetchReads(const std::string &referenceName, const hts_pos_t &referencePosition) {
	if ( (bamFile_ == nullptr) || (bamIndex_ == nullptr) ) {
		throw std::string("ERROR: no indexed BAM file is open in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	const int32_t referenceID = sam_hdr_name2tid( bamHeader_.get(), referenceName.c_str() );
	if (referenceID < 0) {
		throw std::string("ERROR: reference ") + referenceName
			+ std::string(" not found in the BAM file ") + bamFileName_ + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	std::unique_ptr<hts_itr_t, BAMiteratorDeleter> regionIterator{
		sam_itr_queryi(bamIndex_.get(), referenceID, referencePosition, referencePosition + 1)
	};
	if (regionIterator == nullptr) {
		throw std::string("ERROR: failed to query ") + referenceName + std::string(":")
			+ std::to_string(referencePosition + 1) + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	std::unique_ptr<bam1_t, BAMrecordDeleter> bamRecord{bam_init1()};
	std::vector<AlignedRead> reads;
	int readStatus{0};
	while ( ( readStatus = sam_itr_next( bamFile_.get(), regionIterator.get(), bamRecord.get() ) ) >= 0 ) {
		if ( (bamRecord->core.flag & skipFlags_) != 0 ) {
			continue;
		}
		reads.emplace_back( bamRecord.get() );
	}
	if (readStatus < -1) {
		throw std::string("ERROR: failed to read alignments at ") + referenceName + std::string(":")
			+ std::to_string(referencePosition + 1) + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	return reads;
}

// VariantAnnotator methods
const std::string VariantAnnotator::ffpeFilterName_{"FFPE"};
const std::string VariantAnnotator::umiFieldName_{"UMI"};
const std::string VariantAnnotator::summaryFieldName_{"SUMI"};

VariantAnnotator::VariantAnnotator(BamAndVcfFiles inputFiles, ClassifierParameters parameters) :
									inputFiles_{std::move(inputFiles)}, parameters_{std::move(parameters)} {
	// throws if the BAM file cannot be opened or has no index
	const BAMfile testBAM(inputFiles_.bamFileName);
	std::unique_ptr<htsFile, HTSfileDeleter> vcfFile{ bcf_open(inputFiles_.vcfFileName.c_str(), "r") };
	if (vcfFile == nullptr) {
		throw std::string("ERROR: failed to open the VCF file ")
			+ inputFiles_.vcfFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	const std::unique_ptr<bcf_hdr_t, BCFheaderDeleter> vcfHeader{ bcf_hdr_read( vcfFile.get() ) };
	if (vcfHeader == nullptr) {
		throw std::string("ERROR: failed to read the header from the VCF file ")
			+ inputFiles_.vcfFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	parameters_.nThreads = std::max(parameters_.nThreads, 1UL);
	if (parameters_.queueCapacity == 0) {
		parameters_.queueCapacity = 4 * parameters_.nThreads;
	}
	if (parameters_.vafPercentRange.first > parameters_.vafPercentRange.second) {
		std::swap(parameters_.vafPercentRange.first, parameters_.vafPercentRange.second);
	}
}

AnnotationSummary VariantAnnotator::saveAnnotatedVCF(const std::string &outVCFname) const {
	std::unique_ptr<htsFile, HTSfileDeleter> vcfFile{ bcf_open(inputFiles_.vcfFileName.c_str(), "r") };
	if (vcfFile == nullptr) {
		throw std::string("ERROR: failed to open the VCF file ")
			+ inputFiles_.vcfFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	std::unique_ptr<bcf_hdr_t, BCFheaderDeleter> vcfHeader{ bcf_hdr_read( vcfFile.get() ) };
	if (vcfHeader == nullptr) {
		throw std::string("ERROR: failed to read the header from the VCF file ")
			+ inputFiles_.vcfFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	// records are read with the annotated header so that the new IDs are valid in all records
	addAnnotationHeaderLines_( vcfHeader.get() );
	// the header is read-only from here on; it is shared by the reader, workers and writer
	declareRecordFields_( inputFiles_.vcfFileName, vcfHeader.get() );
	const int nHeaderRecords{vcfHeader->nhrec};

	const std::string gzSuffix{".gz"};
	const bool compressOutput = (outVCFname.size() > gzSuffix.size()) &&
		std::equal( gzSuffix.crbegin(), gzSuffix.crend(), outVCFname.crbegin() );
	std::unique_ptr<htsFile, HTSfileDeleter> outFile{ bcf_open(outVCFname.c_str(), compressOutput ? "wz" : "w") };
	if (outFile == nullptr) {
		throw std::string("ERROR: failed to open the output VCF file ")
			+ outVCFname + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	if (bcf_hdr_write( outFile.get(), vcfHeader.get() ) != 0) {
		throw std::string("ERROR: failed to write the header to the output VCF file ")
			+ outVCFname + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}

	const bool saveCSV = !parameters_.csvFileName.empty() && (parameters_.csvFileName != "NULL");
	std::fstream csvStream;
	if (saveCSV) {
		csvStream.open(parameters_.csvFileName, std::ios::out | std::ios::trunc);
		if ( !csvStream.is_open() ) {
			throw std::string("ERROR: failed to open the CSV file ")
				+ parameters_.csvFileName + std::string(" in ")
				+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
		}
		csvStream << "chromosome,position,reference,alternative,mismatch,reference_support,variant_support,"
					"ffpe_molecules,paired_molecules,ffpe_vaf,filter\n";
	}

	// one BAM handle per worker; opened here so that failures surface before any thread starts
	std::vector<BAMfile> workerBAMs;
	workerBAMs.reserve(parameters_.nThreads);
	for (size_t iThread = 0; iThread < parameters_.nThreads; ++iThread) {
		workerBAMs.emplace_back(inputFiles_.bamFileName);
	}

	BoundedQueue<VariantTask>     workQueue(parameters_.queueCapacity);
	BoundedQueue<AnnotatedRecord> resultQueue(parameters_.queueCapacity);

	auto producerTask = std::async(
		std::launch::async,
		[&vcfFile, &vcfHeader, &workQueue, nHeaderRecords] {
			uint64_t recordIndex{0};
			int readStatus{0};
			while (true) {
				VariantTask currentTask;
				currentTask.index = recordIndex;
				currentTask.record.reset( bcf_init() );
				readStatus = bcf_read( vcfFile.get(), vcfHeader.get(), currentTask.record.get() );
				if (readStatus < 0) {
					break;
				}
				if (vcfHeader->nhrec != nHeaderRecords) {
					workQueue.close();
					throw std::string("ERROR: the VCF header changed while reading record ") + std::to_string(recordIndex + 1)
						+ std::string(" in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
				}
				bcf_unpack(currentTask.record.get(), BCF_UN_ALL);
				if ( !workQueue.push( std::move(currentTask) ) ) {
					break;
				}
				++recordIndex;
			}
			workQueue.close();
			if (readStatus < -1) {
				throw std::string("ERROR: failed to read VCF record ") + std::to_string(recordIndex + 1)
					+ std::string(" in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
			}
			return recordIndex;
		}
	);

	std::vector< std::future<void> > workerTasks;
	workerTasks.reserve( workerBAMs.size() );
	const bcf_hdr_t *const sharedHeader = vcfHeader.get();
	for (auto &eachBAM : workerBAMs) {
		workerTasks.emplace_back(
			std::async(
				std::launch::async,
				[this, &eachBAM, &workQueue, &resultQueue, sharedHeader] {
					VariantTask currentTask;
					while ( workQueue.pop(currentTask) ) {
						AnnotatedRecord currentResult;
						currentResult.index  = currentTask.index;
						currentResult.record = std::move(currentTask.record);
						try {
							currentResult.site = extractVariantSite( sharedHeader, currentResult.record.get() );
							if ( !isSupportedVariant(currentResult.site) ) {
								currentResult.annotation.status = VariantStatus::UNSUPPORTED_SHAPE;
							} else if ( !eachBAM.hasReference(currentResult.site.chromosome) ) {
								currentResult.annotation.status = VariantStatus::UNKNOWN_REFERENCE;
								currentResult.annotation.warnings.emplace_back("chromosome not in the BAM file");
							} else {
								const std::vector<AlignedRead> reads{eachBAM.fetchReads(currentResult.site.chromosome, currentResult.site.position - 1)};
								currentResult.annotation = annotateVariant(currentResult.site, reads, parameters_.umiParameters, parameters_.ffpeScope);
								writeAnnotation_( sharedHeader, currentResult.annotation, currentResult.record.get() );
							}
						} catch (const std::string &problem) {
							currentResult.annotation.status = VariantStatus::FAILED;
							currentResult.annotation.warnings.emplace_back(problem);
						} catch (const std::exception &problem) {
							currentResult.annotation.status = VariantStatus::FAILED;
							currentResult.annotation.warnings.emplace_back( problem.what() );
						}
						if ( !resultQueue.push( std::move(currentResult) ) ) {
							// the writer stopped; keep draining so the reader can finish
							continue;
						}
					}
				}
			)
		);
	}

	auto writerTask = std::async(
		std::launch::async,
		[this, &outFile, &vcfHeader, &resultQueue, &csvStream, saveCSV] {
			AnnotationSummary summary;
			std::map<uint64_t, AnnotatedRecord> pendingRecords;
			uint64_t nextIndex{0};
			AnnotatedRecord currentResult;
			while ( resultQueue.pop(currentResult) ) {
				const uint64_t currentIndex{currentResult.index};
				pendingRecords.emplace( currentIndex, std::move(currentResult) );
				auto pendingIt = pendingRecords.begin();
				// restore input order
				while ( ( pendingIt != pendingRecords.end() ) && (pendingIt->first == nextIndex) ) {
					const AnnotatedRecord &readyRecord = pendingIt->second;
					if (bcf_write( outFile.get(), vcfHeader.get(), readyRecord.record.get() ) != 0) {
						resultQueue.close();
						throw std::string("ERROR: failed to write VCF record ") + std::to_string(nextIndex + 1)
							+ std::string(" in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
					}
					++summary.nRecords;
					switch (readyRecord.annotation.status) {
						case VariantStatus::ANNOTATED:
							++summary.nAnnotated;
							summary.nFFPE += static_cast<size_t>(readyRecord.annotation.ffpeFiltered);
							break;
						case VariantStatus::UNSUPPORTED_SHAPE:
							++summary.nUnsupported;
							break;
						case VariantStatus::UNKNOWN_REFERENCE:
							++summary.nUnknownReference;
							break;
						case VariantStatus::FAILED:
							++summary.nFailed;
							break;
					}
					for (const auto &eachWarning : readyRecord.annotation.warnings) {
						summary.warnings.emplace_back(
							readyRecord.site.chromosome + ":" + std::to_string(readyRecord.site.position) + ": " + eachWarning
						);
					}
					if ( saveCSV && (readyRecord.annotation.status == VariantStatus::ANNOTATED) ) {
						const AlleleSet alleles{readyRecord.annotation.support.getAlleles()};
						const float ffpePercent{readyRecord.annotation.support.ffpePercent()};
						const bool inScope = (parameters_.ffpeScope == FFPEscope::ALL) ||
												isDeamination( alleles.reference.front(), alleles.alternative.front() );
						const bool inRange = (ffpePercent >= parameters_.vafPercentRange.first) &&
												(ffpePercent <= parameters_.vafPercentRange.second);
						if (inScope && inRange) {
							csvStream << stringifyVariantSupport(readyRecord.site, readyRecord.annotation) << "\n";
						}
					}
					pendingIt = pendingRecords.erase(pendingIt);
					++nextIndex;
				}
			}
			return summary;
		}
	);

	for (const auto &eachWorker : workerTasks) {
		eachWorker.wait();
	}
	resultQueue.close();
	AnnotationSummary summary{writerTask.get()};
	const uint64_t nRecordsRead{producerTask.get()};
	for (auto &eachWorker : workerTasks) {
		eachWorker.get();
	}
	if (nRecordsRead != summary.nRecords) {
		summary.warnings.emplace_back(
			std::to_string(nRecordsRead) + " records read but " + std::to_string(summary.nRecords) + " saved"
		);
	}
	if (saveCSV) {
		csvStream.close();
	}
	return summary;
}

void VariantAnnotator::addAnnotationHeaderLines_(bcf_hdr_t *vcfHeader) {
	const std::array<std::string, 3> headerLines{
		"##FILTER=<ID=" + ffpeFilterName_ + ",Description=\"FFPE artifact: variant supported by only one strand of a UMI molecule\">",
		"##FORMAT=<ID=" + umiFieldName_   + ",Number=1,Type=String,Description=\"UMI molecule support (Paired:ForwardSingle:ReverseSingle) for the variant, then for the reference\">",
		"##FORMAT=<ID=" + summaryFieldName_ + ",Number=1,Type=String,Description=\"UMI molecule counts (reference:mutation:ffpe:other:forwardSingle:reverseSingle)\">"
	};
	for (const auto &eachLine : headerLines) {
		if (bcf_hdr_append( vcfHeader, eachLine.c_str() ) != 0) {
			throw std::string("ERROR: failed to add the header line ") + eachLine
				+ std::string(" in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
		}
	}
	if (bcf_hdr_sync(vcfHeader) != 0) {
		throw std::string("ERROR: failed to update the VCF header in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
}

void VariantAnnotator::declareRecordFields_(const std::string &vcfFileName, bcf_hdr_t *vcfHeader) {
	std::unique_ptr<htsFile, HTSfileDeleter> vcfFile{ bcf_open(vcfFileName.c_str(), "r") };
	if (vcfFile == nullptr) {
		throw std::string("ERROR: failed to open the VCF file ")
			+ vcfFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	// only read to move the file past its header
	std::unique_ptr<bcf_hdr_t, BCFheaderDeleter> skippedHeader{ bcf_hdr_read( vcfFile.get() ) };
	if (skippedHeader == nullptr) {
		throw std::string("ERROR: failed to read the header from the VCF file ")
			+ vcfFileName + std::string(" in ")
			+ std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
	std::unique_ptr<bcf1_t, BCFrecordDeleter> vcfRecord{ bcf_init() };
	uint64_t nRecords{0};
	int readStatus{0};
	while ( ( readStatus = bcf_read( vcfFile.get(), vcfHeader, vcfRecord.get() ) ) == 0 ) {
		++nRecords;
	}
	if (readStatus < -1) {
		throw std::string("ERROR: failed to read VCF record ") + std::to_string(nRecords + 1)
			+ std::string(" from ") + vcfFileName
			+ std::string(" in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
	}
}

void VariantAnnotator::writeAnnotation_(const bcf_hdr_t *vcfHeader, const VariantAnnotation &annotation, bcf1_t *vcfRecord) {
	if (annotation.status != VariantStatus::ANNOTATED) {
		return;
	}
	const int32_t nSamples = bcf_hdr_nsamples(vcfHeader);
	if (nSamples > 0) {
		const std::string umiString{annotation.support.umiField()};
		const std::string summaryString{annotation.support.moleculeSummaryField()};
		std::vector<const char *> umiValues(static_cast<size_t>(nSamples), umiString.c_str());
		std::vector<const char *> summaryValues(static_cast<size_t>(nSamples), summaryString.c_str());
		if (bcf_update_format_string( vcfHeader, vcfRecord, umiFieldName_.c_str(), umiValues.data(), nSamples ) < 0) {
			throw std::string("ERROR: failed to set the ") + umiFieldName_
				+ std::string(" field in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
		}
		if (bcf_update_format_string( vcfHeader, vcfRecord, summaryFieldName_.c_str(), summaryValues.data(), nSamples ) < 0) {
			throw std::string("ERROR: failed to set the ") + summaryFieldName_
				+ std::string(" field in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
		}
	}
	if (annotation.ffpeFiltered) {
		const int filterID = bcf_hdr_id2int( vcfHeader, BCF_DT_ID, ffpeFilterName_.c_str() );
		if ( (filterID < 0) || (bcf_add_filter(vcfHeader, vcfRecord, filterID) < 0) ) {
			throw std::string("ERROR: failed to set the ") + ffpeFilterName_
				+ std::string(" filter in ") + std::string( static_cast<const char*>(__PRETTY_FUNCTION__) );
		}
	}
}
