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

/// Classify FFPE artifacts among variant calls
/** \file
 * \author Anthony J. Greenberg and Rebekah Rogers
 * \copyright Copyright (c) 2024 Anthony J. Greenberg and Rebekah Rogers
 * \version 0.1
 *
 * Reconstructs UMI-tagged double-stranded molecules from read alignments and uses them
 * to flag FFPE deamination artifacts among single-nucleotide variant calls.
 *
 */

#include <string>
#include <unordered_map>
#include <iostream>

#include "umiClassifier.hpp"
#include "helperFunctions.hpp"

int main(int argc, char *argv[]) {
	// set usage message
	const std::string cliHelp = "Available command line flags (in any order):\n"
		"  --input-bam           bam_file_name (input BAM file name; must be coordinate-sorted and indexed; required).\n"
		"  --input-vcf           vcf_file_name (input VCF or BCF file name; required).\n"
		"  --out                 out_file_name (output VCF file name; compressed if it ends in .gz; required).\n"
		"  --threads             number_of_threads (maximal number of threads to use; defaults to maximal available).\n"
		"  --queue-size          queue_capacity (number of records waiting for processing; defaults to four times the thread number).\n"
		"  --ffpe-nucleotides    standard|all (substitutions eligible for the FFPE call: C>T and G>A only, or all; defaults to standard).\n"
		"  --umi-position        qrn|rx (UMI in the read name or the RX tag; defaults to qrn).\n"
		"  --qrn-split-character character (separates the UMI from the rest of the read name; defaults to _).\n"
		"  --umi-split-character separator (separates the two UMI barcodes; half splits the UMI in the middle;\n"
		"                        defaults to + for qrn and half for rx).\n"
		"  --out-csv             csv_file_name (per-variant molecule summary; not saved if omitted).\n"
		"  --vaf-min             percent (minimal FFPE VAF for CSV rows; defaults to 0).\n"
		"  --vaf-max             percent (maximal FFPE VAF for CSV rows; defaults to 100).\n";
	try {
		std::unordered_map <std::string, std::string> stringVariables;
		std::unordered_map <std::string, int>         intVariables;
		std::unordered_map <std::string, float>       floatVariables;
		const auto clInfo{umiSpace::parseCL(argc, argv)};
		umiSpace::extractCLinfo(clInfo, intVariables, floatVariables, stringVariables);
		const umiSpace::ClassifierParameters parameters{umiSpace::makeClassifierParameters(intVariables, floatVariables, stringVariables)};
		umiSpace::BamAndVcfFiles bamAndVCF;
		bamAndVCF.bamFileName = stringVariables.at("input-bam");
		bamAndVCF.vcfFileName = stringVariables.at("input-vcf");
		const umiSpace::VariantAnnotator annotator(bamAndVCF, parameters);
		const umiSpace::AnnotationSummary summary{annotator.saveAnnotatedVCF( stringVariables.at("out") )};
		for (const auto &eachWarning : summary.warnings) {
			std::cerr << "WARNING: " << eachWarning << "\n";
		}
		std::cerr << "Processed " << summary.nRecords << " variant records: "
			<< summary.nAnnotated << " annotated ("
			<< summary.nFFPE << " with FFPE artifacts), "
			<< summary.nUnsupported << " not single-nucleotide substitutions, "
			<< summary.nUnknownReference << " on chromosomes absent from the BAM file, "
			<< summary.nFailed << " failed\n";
		return 0;
	} catch(std::string &problem) {
		std::cerr << problem << "\n";
		std::cerr << cliHelp;
		return 1;
	}
}
