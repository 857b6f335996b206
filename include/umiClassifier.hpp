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
 * Interface definitions of classes that group `.bam` reads into UMI-tagged double-stranded molecules
 * and classify single-nucleotide variant calls as true mutations or FFPE deamination artifacts.
 *
 */

#pragma once

#include <utility>
#include <vector>
#include <array>
#include <memory>
#include <unordered_map>
#include <string>

#include "hts.h"
#include "sam.h"
#include "vcf.h"

namespace umiSpace {
	struct BamAndVcfFiles;
	struct UMIpair;
	struct UMIparameters;
	struct ClassifierParameters;
	struct AlleleSet;
	struct AlleleSupport;
	struct MoleculeGroup;
	struct MoleculeTallies;
	struct MoleculeClassification;
	struct VariantSite;
	struct VariantAnnotation;
	struct AnnotationSummary;
	struct BAMrecordDeleter;
	struct BAMheaderDeleter;
	struct BAMindexDeleter;
	struct BAMiteratorDeleter;
	struct HTSfileDeleter;
	struct BCFheaderDeleter;
	struct BCFrecordDeleter;
	class  AlignedRead;
	class  BaseTally;
	class  MoleculeGroups;
	class  PositionSupport;
	class  BAMfile;
	class  VariantAnnotator;

	/** \brief Gap symbol
	 *
	 * Reported when the reference position is not aligned to any read base.
	 */
	constexpr char gapSymbol{'-'};
	/** \brief Unknown base symbol */
	constexpr char unknownBase{'N'};

	/** \brief Where the UMI is stored in an alignment record */
	enum class UMIsource : uint8_t {
		READ_NAME, ///< last field of the query name
		RX_TAG     ///< `RX` auxiliary tag
	};
	/** \brief Strand of the original double-stranded molecule */
	enum class MoleculeStrand : uint8_t {
		FORWARD,
		REVERSE
	};
	/** \brief Paired molecule classification categories */
	enum class MoleculeCategory : uint8_t {
		REFERENCE, ///< both strands support the reference
		MUTATION,  ///< both strands support the alternative
		FFPE,      ///< only one strand supports the alternative
		OTHER      ///< none of the above
	};
	/** \brief Substitutions eligible for the FFPE call */
	enum class FFPEscope : uint8_t {
		DEAMINATION, ///< C:G>T:A substitutions only
		ALL          ///< all substitutions
	};
	/** \brief Outcome of variant record processing */
	enum class VariantStatus : uint8_t {
		ANNOTATED,         ///< UMI fields written
		UNSUPPORTED_SHAPE, ///< not a single-nucleotide substitution, passed through
		UNKNOWN_REFERENCE, ///< chromosome absent from the BAM file, passed through
		FAILED             ///< processing error, passed through
	};

	/** \brief BAM and VCF file name pair */
	struct BamAndVcfFiles {
		/** \brief BAM file name
		 *
		 * The file must be coordinate-sorted and indexed.
		 */
		std::string bamFileName;
		/** \brief VCF file name */
		std::string vcfFileName;
	};
	/** \brief Left and right UMI barcodes
	 *
	 * Both strings are empty if the UMI could not be parsed.
	 */
	struct UMIpair {
		/** \brief Left barcode */
		std::string left;
		/** \brief Right barcode */
		std::string right;
	};
	/** \brief UMI extraction parameters */
	struct UMIparameters {
		/** \brief UMI location */
		UMIsource source{UMIsource::READ_NAME};
		/** \brief Character separating the UMI field from the rest of the read name */
		char readNameSeparator{'_'};
		/** \brief Separator between the two barcodes
		 *
		 * If empty, the UMI field is split at its midpoint.
		 */
		std::string umiSeparator{"+"};
	};
	/** \brief Run-time parameters for FFPE classification */
	struct ClassifierParameters {
		/** \brief UMI extraction parameters */
		UMIparameters umiParameters;
		/** \brief Substitutions eligible for an FFPE call */
		FFPEscope ffpeScope{FFPEscope::DEAMINATION};
		/** \brief Number of worker threads */
		size_t nThreads{1};
		/** \brief Work queue capacity
		 *
		 * Set to four times the thread number if 0.
		 */
		size_t queueCapacity{0};
		/** \brief CSV summary file name
		 *
		 * No summary is saved if empty or `NULL`.
		 */
		std::string csvFileName;
		/** \brief Inclusive FFPE VAF percentage range for CSV rows */
		std::pair<float, float> vafPercentRange{0.0F, 100.0F};
	};
	/** \brief Queried alleles
	 *
	 * Each character is one single-nucleotide allele.
	 */
	struct AlleleSet {
		/** \brief Reference alleles */
		std::string reference;
		/** \brief Alternative alleles */
		std::string alternative;
	};
	/** \brief Molecule support for an allele */
	struct AlleleSupport {
		/** \brief Read count from paired molecules */
		uint32_t paired{0};
		/** \brief Read count from forward-only molecules */
		uint32_t forwardSingle{0};
		/** \brief Read count from reverse-only molecules */
		uint32_t reverseSingle{0};
	};
	/** \brief Reads from one double-stranded molecule
	 *
	 * Pointers refer to reads owned elsewhere.
	 */
	struct MoleculeGroup {
		/** \brief Reads from the forward molecule strand */
		std::vector<const AlignedRead *> forwardReads;
		/** \brief Reads from the reverse molecule strand */
		std::vector<const AlignedRead *> reverseReads;
	};
	/** \brief Variant record position and alleles */
	struct VariantSite {
		/** \brief Chromosome name */
		std::string chromosome;
		/** \brief Base-1 position */
		hts_pos_t position{0};
		/** \brief Reference allele */
		std::string reference;
		/** \brief Alternative alleles */
		std::vector<std::string> alternatives;
	};
	/** \brief Run summary */
	struct AnnotationSummary {
		/** \brief Number of variant records read */
		size_t nRecords{0};
		/** \brief Number of records with UMI annotation */
		size_t nAnnotated{0};
		/** \brief Number of records that are not single-nucleotide substitutions */
		size_t nUnsupported{0};
		/** \brief Number of records on chromosomes absent from the BAM file */
		size_t nUnknownReference{0};
		/** \brief Number of records that failed processing */
		size_t nFailed{0};
		/** \brief Number of records with the FFPE filter */
		size_t nFFPE{0};
		/** \brief Warning messages */
		std::vector<std::string> warnings;
	};

	/** \brief BAM record deleter */
	struct BAMrecordDeleter {
		void operator()(bam1_t *bamRecord) const noexcept { bam_destroy1(bamRecord); };
	};
	/** \brief BAM header deleter */
	struct BAMheaderDeleter {
		void operator()(sam_hdr_t *samHeader) const noexcept { sam_hdr_destroy(samHeader); };
	};
	/** \brief BAM index deleter */
	struct BAMindexDeleter {
		void operator()(hts_idx_t *bamIndex) const noexcept { hts_idx_destroy(bamIndex); };
	};
	/** \brief BAM region iterator deleter */
	struct BAMiteratorDeleter {
		void operator()(hts_itr_t *bamIterator) const noexcept { hts_itr_destroy(bamIterator); };
	};
	/** \brief SAM/BAM/VCF/BCF file handle deleter */
	struct HTSfileDeleter {
		void operator()(htsFile *htsHandle) const noexcept { hts_close(htsHandle); };
	};
	/** \brief VCF header deleter */
	struct BCFheaderDeleter {
		void operator()(bcf_hdr_t *vcfHeader) const noexcept { bcf_hdr_destroy(vcfHeader); };
	};
	/** \brief VCF record deleter */
	struct BCFrecordDeleter {
		void operator()(bcf1_t *vcfRecord) const noexcept { bcf_destroy(vcfRecord); };
	};

	/** \brief Aligned read
	 *
	 * Stores the parts of a BAM alignment record needed to reconstruct molecules.
	 */
	class AlignedRead {
	public:
		/** \brief Default constructor */
		AlignedRead() = default;
		/** \brief Constructor with data
		 *
		 * Constructs an object from an HTSLIB alignment record.
		 *
		 * \param[in] alignmentRecord pointer to a read alignment record
		 */
		AlignedRead(const bam1_t *alignmentRecord);
		/** \brief Copy constructor
		 *
		 * \param[in] toCopy object to copy
		 */
		AlignedRead(const AlignedRead &toCopy) = default;
		/** \brief Copy assignment operator
		 *
		 * \param[in] toCopy object to copy
		 * \return `AlignedRead` object
		 */
		AlignedRead& operator=(const AlignedRead &toCopy) = default;
		/** \brief Move constructor
		 *
		 * \param[in] toMove object to move
		 */
		AlignedRead(AlignedRead &&toMove) noexcept = default;
		/** \brief Move assignment operator
		 *
		 * \param[in] toMove object to move
		 * \return `AlignedRead` object
		 */
		AlignedRead& operator=(AlignedRead &&toMove) noexcept = default;
		/** \brief Destructor */
		~AlignedRead() = default;

		/** \brief Output read name
		 *
		 * \return read name
		 */
		[[gnu::warn_unused_result]] std::string getReadName() const { return readName_; };
		/** \brief `RX` tag value
		 *
		 * \return UMI tag, empty if absent
		 */
		[[gnu::warn_unused_result]] std::string getUMItag() const { return umiTag_; };
		/** \brief Read sequence
		 *
		 * Query sequence as stored in the BAM record, including soft-clipped bases.
		 *
		 * \return read sequence
		 */
		[[gnu::warn_unused_result]] std::string getSequence() const { return sequence_; };
		/** \brief Read length
		 *
		 * \return read length in bases
		 */
		[[gnu::warn_unused_result]] hts_pos_t getReadLength() const noexcept { return static_cast<hts_pos_t>( sequence_.size() ); };
		/** \brief Is this the first read in the pair?
		 *
		 * \return `true` if the read is the first mate
		 */
		[[gnu::warn_unused_result]] bool isFirstMate() const noexcept { return isFirstMate_; };
		/** \brief Is the read reverse-complemented?
		 *
		 * \return `true` if the read is reverse-complemented
		 */
		[[gnu::warn_unused_result]] bool isRevComp() const noexcept { return isRev_; };
		/** \brief Reference positions along the read
		 *
		 * One element per read base. Base-0 reference positions, with `-1` for
		 * soft-clipped and inserted bases.
		 *
		 * \return vector of reference positions
		 */
		[[gnu::warn_unused_result]] std::vector<hts_pos_t> getReferencePositions() const { return referencePositions_; };
		/** \brief Strand of the original molecule
		 *
		 * First mates on the forward strand and second mates on the reverse strand
		 * come from the forward molecule strand; the other two combinations come from the reverse strand.
		 *
		 * \return molecule strand
		 */
		[[gnu::warn_unused_result]] MoleculeStrand getMoleculeStrand() const noexcept;
		/** \brief Base at a reference position
		 *
		 * Returns `A`, `C`, `G`, or `T`, `N` for any other read base,
		 * and the gap symbol if the position is not aligned to a read base.
		 *
		 * \param[in] referencePosition base-0 reference position
		 * \return base at the position
		 */
		[[gnu::warn_unused_result]] char getBaseAt(const hts_pos_t &referencePosition) const;
	private:
		/** \brief Query (read) consumption status array
		 *
		 * Can be indexed into using the CIGAR operation bit field.
		 */
		static const std::array<hts_pos_t, 10> queryConsumption_;
		/** \brief Reference consumption status array
		 *
		 * Can be indexed into using the CIGAR operation bit field.
		 */
		static const std::array<hts_pos_t, 10> referenceConsumption_;
		/** \brief Is the read the first mate? */
		bool isFirstMate_{false};
		/** \brief Is the read reverse-complemented? */
		bool isRev_{false};
		/** \brief Read name */
		std::string readName_;
		/** \brief UMI from the `RX` tag */
		std::string umiTag_;
		/** \brief Read sequence */
		std::string sequence_;
		/** \brief Base-0 reference position of each read base */
		std::vector<hts_pos_t> referencePositions_;
	};

	/** \brief Base counts at a position
	 *
	 * Counts `A`, `T`, `G`, `C`, `N`, and gap symbols.
	 */
	class BaseTally {
	public:
		/** \brief Default constructor */
		BaseTally() = default;
		/** \brief Copy constructor
		 *
		 * \param[in] toCopy object to copy
		 */
		BaseTally(const BaseTally &toCopy) = default;
		/** \brief Copy assignment operator
		 *
		 * \param[in] toCopy object to copy
		 * \return `BaseTally` object
		 */
		BaseTally& operator=(const BaseTally &toCopy) = default;
		/** \brief Move constructor
		 *
		 * \param[in] toMove object to move
		 */
		BaseTally(BaseTally &&toMove) noexcept = default;
		/** \brief Move assignment operator
		 *
		 * \param[in] toMove object to move
		 * \return `BaseTally` object
		 */
		BaseTally& operator=(BaseTally &&toMove) noexcept = default;
		/** \brief Destructor */
		~BaseTally() = default;

		/** \brief Add a base
		 *
		 * Symbols other than nucleotides and the gap are counted as `N`.
		 *
		 * \param[in] base base to add
		 */
		void addBase(const char &base) noexcept;
		/** \brief Is the symbol counted?
		 *
		 * \param[in] symbol symbol to test
		 * \return `true` if the symbol has a count
		 */
		[[gnu::warn_unused_result]] bool tracks(const char &symbol) const noexcept;
		/** \brief Symbol count
		 *
		 * Throws if the symbol is not tracked.
		 *
		 * \param[in] symbol symbol to look up
		 * \return number of times the symbol was added
		 */
		[[gnu::warn_unused_result]] uint32_t count(const char &symbol) const;
		/** \brief Total count
		 *
		 * \return number of bases added
		 */
		[[gnu::warn_unused_result]] uint32_t total() const noexcept;
	private:
		/** \brief Tracked symbols in count order */
		static const std::array<char, 6> symbols_;
		/** \brief Symbol counts */
		std::array<uint32_t, 6> counts_{};
		/** \brief Index of a symbol
		 *
		 * \param[in] symbol symbol to look up
		 * \return index into the count array, equal to its size if the symbol is not tracked
		 */
		[[gnu::warn_unused_result]] static size_t symbolIndex_(const char &symbol) noexcept;
	};

	/** \brief Base tallies for the two strands of a molecule */
	struct MoleculeTallies {
		/** \brief Molecule key */
		std::string moleculeKey;
		/** \brief Forward strand base tally */
		BaseTally forwardTally;
		/** \brief Reverse strand base tally */
		BaseTally reverseTally;
	};
	/** \brief Classification of a paired molecule */
	struct MoleculeClassification {
		/** \brief Category */
		MoleculeCategory category{MoleculeCategory::OTHER};
		/** \brief Forward strand base tally */
		BaseTally forwardTally;
		/** \brief Reverse strand base tally */
		BaseTally reverseTally;
		/** \brief Queried alleles absent from the tallies */
		std::string excludedAlleles;
	};

	/** \brief Reads grouped by molecule
	 *
	 * Groups reads that share a UMI pair into double-stranded molecules.
	 * Stores pointers to the reads, so the read vector must outlive the object.
	 */
	class MoleculeGroups {
	public:
		/** \brief Default constructor */
		MoleculeGroups() = default;
		/** \brief Constructor with reads
		 *
		 * Reads with unparseable UMIs are skipped and their names saved.
		 *
		 * \param[in] reads reads overlapping a position
		 * \param[in] umiParameters UMI extraction parameters
		 */
		MoleculeGroups(const std::vector<AlignedRead> &reads, const UMIparameters &umiParameters);
		/** \brief Copy constructor
		 *
		 * \param[in] toCopy object to copy
		 */
		MoleculeGroups(const MoleculeGroups &toCopy) = default;
		/** \brief Copy assignment operator
		 *
		 * \param[in] toCopy object to copy
		 * \return `MoleculeGroups` object
		 */
		MoleculeGroups& operator=(const MoleculeGroups &toCopy) = default;
		/** \brief Move constructor
		 *
		 * \param[in] toMove object to move
		 */
		MoleculeGroups(MoleculeGroups &&toMove) noexcept = default;
		/** \brief Move assignment operator
		 *
		 * \param[in] toMove object to move
		 * \return `MoleculeGroups` object
		 */
		MoleculeGroups& operator=(MoleculeGroups &&toMove) noexcept = default;
		/** \brief Destructor */
		~MoleculeGroups() = default;

		/** \brief Number of molecules
		 *
		 * \return number of molecule groups
		 */
		[[gnu::warn_unused_result]] size_t nMolecules() const noexcept { return groups_.size(); };
		/** \brief Number of molecules with reads from both strands
		 *
		 * \return number of paired molecule groups
		 */
		[[gnu::warn_unused_result]] size_t nPairedMolecules() const noexcept;
		/** \brief Names of reads with unparseable UMIs
		 *
		 * \return vector of read names
		 */
		[[gnu::warn_unused_result]] std::vector<std::string> unparseableReads() const { return unparseableReads_; };
		/** \brief Molecule group with a given key
		 *
		 * \param[in] moleculeKey molecule key
		 * \return molecule group
		 */
		[[gnu::warn_unused_result]] const MoleculeGroup& at(const std::string &moleculeKey) const { return groups_.at(moleculeKey); };
		/** \brief Base tallies at a position
		 *
		 * \param[in] referencePosition base-0 reference position
		 * \return vector of strand tallies, one per molecule
		 */
		[[gnu::warn_unused_result]] std::vector<MoleculeTallies> tallyBases(const hts_pos_t &referencePosition) const;
	private:
		/** \brief Molecule groups indexed by molecule key */
		std::unordered_map<std::string, MoleculeGroup> groups_;
		/** \brief Names of reads with unparseable UMIs */
		std::vector<std::string> unparseableReads_;
	};

	/** \brief Molecule support at a variant position
	 *
	 * Classifies paired molecules and sums support across all molecules at a position.
	 */
	class PositionSupport {
	public:
		/** \brief Default constructor */
		PositionSupport() = default;
		/** \brief Constructor with molecule tallies
		 *
		 * Classifies each paired molecule and adds its counts to the per-allele support.
		 * Molecules with no reads are ignored.
		 *
		 * \param[in] moleculeTallies per-molecule strand tallies
		 * \param[in] alleles queried alleles
		 */
		PositionSupport(const std::vector<MoleculeTallies> &moleculeTallies, AlleleSet alleles);
		/** \brief Copy constructor
		 *
		 * \param[in] toCopy object to copy
		 */
		PositionSupport(const PositionSupport &toCopy) = default;
		/** \brief Copy assignment operator
		 *
		 * \param[in] toCopy object to copy
		 * \return `PositionSupport` object
		 */
		PositionSupport& operator=(const PositionSupport &toCopy) = default;
		/** \brief Move constructor
		 *
		 * \param[in] toMove object to move
		 */
		PositionSupport(PositionSupport &&toMove) noexcept = default;
		/** \brief Move assignment operator
		 *
		 * \param[in] toMove object to move
		 * \return `PositionSupport` object
		 */
		PositionSupport& operator=(PositionSupport &&toMove) noexcept = default;
		/** \brief Destructor */
		~PositionSupport() = default;

		/** \brief Support for an allele
		 *
		 * Throws if the allele was not queried.
		 *
		 * \param[in] allele allele symbol
		 * \return molecule support
		 */
		[[gnu::warn_unused_result]] AlleleSupport getSupport(const char &allele) const;
		/** \brief Queried alleles
		 *
		 * \return allele set
		 */
		[[gnu::warn_unused_result]] AlleleSet getAlleles() const { return alleles_; };
		/** \brief Number of paired molecules in a category
		 *
		 * \param[in] category molecule category
		 * \return molecule count
		 */
		[[gnu::warn_unused_result]] uint32_t nMolecules(const MoleculeCategory &category) const noexcept;
		/** \brief Number of paired molecules
		 *
		 * \return paired molecule count
		 */
		[[gnu::warn_unused_result]] uint32_t nPairedMolecules() const noexcept;
		/** \brief Number of forward-only molecules
		 *
		 * \return forward singleton count
		 */
		[[gnu::warn_unused_result]] uint32_t nForwardSingletons() const noexcept { return nForwardSingletons_; };
		/** \brief Number of reverse-only molecules
		 *
		 * \return reverse singleton count
		 */
		[[gnu::warn_unused_result]] uint32_t nReverseSingletons() const noexcept { return nReverseSingletons_; };
		/** \brief Is there an FFPE artifact?
		 *
		 * \return `true` if at least one paired molecule is classified as an FFPE artifact
		 */
		[[gnu::warn_unused_result]] bool hasFFPEartifact() const noexcept { return nMolecules(MoleculeCategory::FFPE) > 0; };
		/** \brief Percent of paired molecules that are FFPE artifacts
		 *
		 * \return FFPE VAF percentage, 0 if there are no paired molecules
		 */
		[[gnu::warn_unused_result]] float ffpePercent() const noexcept;
		/** \brief Alleles excluded from classification
		 *
		 * \return symbols that could not be looked up in the base tallies
		 */
		[[gnu::warn_unused_result]] std::string excludedAlleles() const { return excludedAlleles_; };
		/** \brief UMI format field
		 *
		 * `Paired:ForwardSingle:ReverseSingle` for the alternative alleles,
		 * followed by the same for the reference alleles after a `;`.
		 *
		 * \return UMI field string
		 */
		[[gnu::warn_unused_result]] std::string umiField() const;
		/** \brief Molecule summary format field
		 *
		 * `reference:mutation:ffpe:other:forwardSingle:reverseSingle` molecule counts.
		 *
		 * \return SUMI field string
		 */
		[[gnu::warn_unused_result]] std::string moleculeSummaryField() const;
	private:
		/** \brief Queried alleles */
		AlleleSet alleles_;
		/** \brief Support indexed by allele */
		std::unordered_map<char, AlleleSupport> support_;
		/** \brief Paired molecule counts in `MoleculeCategory` order */
		std::array<uint32_t, 4> categoryCounts_{};
		/** \brief Forward-only molecule count */
		uint32_t nForwardSingletons_{0};
		/** \brief Reverse-only molecule count */
		uint32_t nReverseSingletons_{0};
		/** \brief Alleles absent from the tallies */
		std::string excludedAlleles_;

		/** \brief Stringify allele support for a set of alleles
		 *
		 * \param[in] alleleSymbols allele symbols
		 * \return `,`-separated `Paired:ForwardSingle:ReverseSingle` triples
		 */
		[[gnu::warn_unused_result]] std::string stringifySupport_(const std::string &alleleSymbols) const;
	};

	/** \brief Annotation of a variant record */
	struct VariantAnnotation {
		/** \brief Processing outcome */
		VariantStatus status{VariantStatus::FAILED};
		/** \brief Does the record get the FFPE filter? */
		bool ffpeFiltered{false};
		/** \brief Molecule support
		 *
		 * Only meaningful for annotated records.
		 */
		PositionSupport support;
		/** \brief Warning messages */
		std::vector<std::string> warnings;
	};

	/** \brief Indexed BAM file
	 *
	 * Provides position queries of a coordinate-sorted and indexed BAM file.
	 * Each object holds its own file handle, so it must not be shared among threads.
	 */
	class BAMfile {
	public:
		/** \brief Default constructor */
		BAMfile() = default;
		/** \brief Constructor with file name
		 *
		 * \param[in] bamFileName BAM file name
		 */
		BAMfile(const std::string &bamFileName);
		/** \brief Copy constructor (deleted) */
		BAMfile(const BAMfile &toCopy) = delete;
		/** \brief Copy assignment operator (deleted) */
		BAMfile& operator=(const BAMfile &toCopy) = delete;
		/** \brief Move constructor
		 *
		 * \param[in] toMove object to move
		 */
		BAMfile(BAMfile &&toMove) noexcept = default;
		/** \brief Move assignment operator
		 *
		 * \param[in] toMove object to move
		 * \return `BAMfile` object
		 */
		BAMfile& operator=(BAMfile &&toMove) noexcept = default;
		/** \brief Destructor */
		~BAMfile() = default;

		/** \brief Is the reference sequence in the BAM header?
		 *
		 * \param[in] referenceName reference sequence (e.g., chromosome) name
		 * \return `true` if the reference is present
		 */
		[[gnu::warn_unused_result]] bool hasReference(const std::string &referenceName) const;
		/** \brief Reads overlapping a position
		 *
		 * Unmapped, secondary, and supplementary alignments are skipped.
		 *
		 * \param[in] referenceName reference sequence name
		 * \param[in] referencePosition base-0 reference position
		 * \return vector of reads
		 */
		[[gnu::warn_unused_result]] std::vector<AlignedRead> fetchReads(const std::string &referenceName, const hts_pos_t &referencePosition);
	private:
		/** \brief Flag marking alignments to skip */
		static const uint16_t skipFlags_;
		/** \brief BAM file name */
		std::string bamFileName_;
		/** \brief File handle */
		std::unique_ptr<htsFile, HTSfileDeleter> bamFile_;
		/** \brief BAM header */
		std::unique_ptr<sam_hdr_t, BAMheaderDeleter> bamHeader_;
		/** \brief BAM index */
		std::unique_ptr<hts_idx_t, BAMindexDeleter> bamIndex_;
	};

	/** \brief Annotate a VCF file with UMI molecule support
	 *
	 * Classifies each single-nucleotide variant in a VCF file using UMI molecules reconstructed
	 * from a BAM file, saving the records with `UMI` and `SUMI` format fields and an `FFPE` filter.
	 */
	class VariantAnnotator {
	public:
		/** \brief Default constructor */
		VariantAnnotator() = default;
		/** \brief Constructor with input files
		 *
		 * Checks that the BAM file is indexed and the VCF file has a readable header.
		 *
		 * \param[in] inputFiles BAM and VCF file names
		 * \param[in] parameters classification parameters
		 */
		VariantAnnotator(BamAndVcfFiles inputFiles, ClassifierParameters parameters);
		/** \brief Copy constructor
		 *
		 * \param[in] toCopy object to copy
		 */
		VariantAnnotator(const VariantAnnotator &toCopy) = default;
		/** \brief Copy assignment operator
		 *
		 * \param[in] toCopy object to copy
		 * \return `VariantAnnotator` object
		 */
		VariantAnnotator& operator=(const VariantAnnotator &toCopy) = default;
		/** \brief Move constructor
		 *
		 * \param[in] toMove object to move
		 */
		VariantAnnotator(VariantAnnotator &&toMove) noexcept = default;
		/** \brief Move assignment operator
		 *
		 * \param[in] toMove object to move
		 * \return `VariantAnnotator` object
		 */
		VariantAnnotator& operator=(VariantAnnotator &&toMove) noexcept = default;
		/** \brief Destructor */
		~VariantAnnotator() = default;

		/** \brief Save the annotated VCF
		 *
		 * Records are processed in parallel and saved in input order.
		 * The output is BGZF-compressed if the file name ends in `.gz`.
		 * If a file with the same name exists it is overwritten.
		 *
		 * \param[in] outVCFname output VCF file name
		 * \return run summary
		 */
		[[gnu::warn_unused_result]] AnnotationSummary saveAnnotatedVCF(const std::string &outVCFname) const;
	private:
		/** \brief FFPE filter name */
		static const std::string ffpeFilterName_;
		/** \brief UMI support format field name */
		static const std::string umiFieldName_;
		/** \brief Molecule summary format field name */
		static const std::string summaryFieldName_;
		/** \brief Input file names */
		BamAndVcfFiles inputFiles_;
		/** \brief Classification parameters */
		ClassifierParameters parameters_;

		/** \brief Add UMI fields and the FFPE filter to a VCF header
		 *
		 * \param[in,out] vcfHeader VCF header
		 */
		static void addAnnotationHeaderLines_(bcf_hdr_t *vcfHeader);
		/** \brief Declare record fields missing from a VCF header
		 *
		 * Reads every record of the VCF file once with the provided header.
		 * htslib adds a header line for each contig, filter, INFO or FORMAT field a record uses but the header lacks.
		 * After this the header does not change while the same file is read again.
		 *
		 * \param[in] vcfFileName VCF file name
		 * \param[in,out] vcfHeader VCF header
		 */
		static void declareRecordFields_(const std::string &vcfFileName, bcf_hdr_t *vcfHeader);
		/** \brief Write annotation to a variant record
		 *
		 * \param[in] vcfHeader VCF header with the annotation lines
		 * \param[in] annotation variant annotation
		 * \param[in,out] vcfRecord variant record to modify
		 */
		static void writeAnnotation_(const bcf_hdr_t *vcfHeader, const VariantAnnotation &annotation, bcf1_t *vcfRecord);
	};
}
